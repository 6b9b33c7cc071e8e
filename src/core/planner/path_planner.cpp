#include "path_planner.hpp"
#include <random>
#include <unordered_set>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace fdup::core {

namespace {
constexpr int kMaxIdAttempts = 16;
} // namespace

auto random_hex_id() -> std::string {
    thread_local std::mt19937_64 rng{[] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64{seq};
    }()};
    return fmt::format("{:016x}{:016x}", rng(), rng());
}

auto partition_name(std::uint64_t copy_index, std::uint64_t per_subfolder) -> std::string {
    if (per_subfolder == 0) {
        return {};
    }
    return fmt::format("part_{}", (copy_index - 1) / per_subfolder + 1);
}

PathPlanner::PathPlanner(std::filesystem::path output_root, IdGenerator id_generator)
    : output_root_(std::move(output_root))
    , id_generator_(std::move(id_generator))
{}

auto PathPlanner::validate_sources(const std::vector<std::filesystem::path>& sources)
    -> infra::VoidResult
{
    if (sources.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidInput,
                                                 "No source files provided"));
    }
    for (const auto& src : sources) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(src, ec)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::SourceNotFound,
                fmt::format("Source not found: {}", src.string())));
        }
    }
    return {};
}

auto PathPlanner::plan(const std::vector<std::filesystem::path>& sources,
                       std::uint64_t copies,
                       std::uint64_t per_subfolder,
                       bool randomize) const
    -> infra::Result<std::vector<CopyTask>>
{
    if (auto valid = validate_sources(sources); !valid) {
        return std::unexpected(std::move(valid.error()));
    }
    if (copies == 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidInput,
                                                 "copies must be > 0"));
    }

    std::vector<CopyTask> tasks;
    tasks.reserve(sources.size() * copies);
    std::unordered_set<std::string> planned_ids;

    for (const auto& src : sources) {
        const auto stem = src.stem().string();
        const auto ext = src.extension().string();

        for (std::uint64_t i = 1; i <= copies; ++i) {
            std::filesystem::path relative = partition_name(i, per_subfolder);

            CopyTask task;
            task.source = src;
            task.copy_index = i;

            if (randomize) {
                std::string id = id_generator_();
                int attempts = 1;
                while (!planned_ids.insert(id).second) {
                    if (attempts++ >= kMaxIdAttempts) {
                        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidInput,
                            fmt::format("Random name generator keeps repeating {}", id)));
                    }
                    spdlog::debug("Random id collision on {}, regenerating", id);
                    id = id_generator_();
                }
                relative /= id + ext;
                task.id = std::move(id);
            } else {
                relative /= fmt::format("{}_{}{}", stem, i, ext);
                task.id = relative.generic_string();
                // Например, два источника с одинаковым именем из разных каталогов
                if (!planned_ids.insert(task.id).second) {
                    return std::unexpected(infra::make_error(infra::ErrorCode::InvalidInput,
                        fmt::format("Source {} produces copy name {} that is already planned",
                                    src.string(), task.id)));
                }
            }

            task.destination = output_root_ / relative;
            tasks.push_back(std::move(task));
        }
    }

    return tasks;
}

} // namespace fdup::core
