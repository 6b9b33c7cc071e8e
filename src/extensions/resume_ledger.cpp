// resume_ledger.cpp
#include "resume_ledger.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

namespace fdup::extensions {

ResumeLedger::ResumeLedger(std::unordered_set<std::string> completed)
    : completed_(std::move(completed))
{}

ResumeLedger::ResumeLedger(ResumeLedger&& other) noexcept {
    std::lock_guard lock(other.mutex_);
    completed_ = std::move(other.completed_);
}

ResumeLedger& ResumeLedger::operator=(ResumeLedger&& other) noexcept {
    if (this != &other) {
        std::scoped_lock lock(mutex_, other.mutex_);
        completed_ = std::move(other.completed_);
    }
    return *this;
}

auto ResumeLedger::state_path(const std::filesystem::path& output_root)
    -> std::filesystem::path
{
    return output_root / kStateFileName;
}

auto ResumeLedger::load(const std::filesystem::path& output_root)
    -> infra::Result<ResumeLedger>
{
    const auto path = state_path(output_root);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return ResumeLedger{};
    }

    auto corrupt = [&path](std::string_view why) {
        return std::unexpected(infra::make_error(infra::ErrorCode::CorruptResumeState,
            fmt::format("Resume state {} is corrupt: {}", path.string(), why)));
    };

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        return std::unexpected(infra::make_error(infra::ErrorCode::CorruptResumeState,
            fmt::format("Cannot read resume state {}", path.string())));
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    const std::string content = buffer.str();
    if (content.find_first_not_of(" \t\r\n") == std::string::npos) {
        return corrupt("file is empty");
    }

    std::unordered_set<std::string> completed;
    try {
        const auto root = nlohmann::json::parse(content);
        if (!root.is_array()) {
            return corrupt("expected an array of task identifiers");
        }
        for (const auto& item : root) {
            if (!item.is_string()) {
                return corrupt("array items must be strings");
            }
            completed.insert(item.get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        return corrupt(e.what());
    }

    spdlog::debug("Loaded {} completed tasks from {}", completed.size(), path.string());
    return ResumeLedger{std::move(completed)};
}

auto ResumeLedger::filter(const std::vector<core::CopyTask>& tasks) const
    -> std::vector<core::CopyTask>
{
    std::lock_guard lock(mutex_);
    std::vector<core::CopyTask> pending;
    pending.reserve(tasks.size());
    std::copy_if(tasks.begin(), tasks.end(), std::back_inserter(pending),
                 [this](const core::CopyTask& task) { return !completed_.contains(task.id); });
    return pending;
}

void ResumeLedger::record(std::string id) {
    std::lock_guard lock(mutex_);
    completed_.insert(std::move(id));
}

auto ResumeLedger::contains(const std::string& id) const -> bool {
    std::lock_guard lock(mutex_);
    return completed_.contains(id);
}

auto ResumeLedger::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return completed_.size();
}

auto ResumeLedger::snapshot() const -> std::vector<std::string> {
    std::vector<std::string> ids;
    {
        std::lock_guard lock(mutex_);
        ids.assign(completed_.begin(), completed_.end());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

auto ResumeLedger::save(const std::filesystem::path& output_root) const
    -> infra::VoidResult
{
    std::error_code ec;
    std::filesystem::create_directories(output_root, ec);
    if (ec) {
        return std::unexpected(infra::make_error_from(ec,
            fmt::format("Cannot create {} for resume state", output_root.string())));
    }

    // Разделитель ", " как у json.dump: файл читается любым JSON-парсером
    std::vector<std::string> items;
    try {
        for (const auto& id : snapshot()) {
            items.push_back(nlohmann::json(id).dump());
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
            fmt::format("Cannot serialize resume state: {}", e.what())));
    }
    const auto text = fmt::format("[{}]", fmt::join(items, ", "));

    const auto tmp = output_root / kTempFileName;
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        ofs << text << '\n';
        ofs.close();
        if (!ofs) {
            std::filesystem::remove(tmp, ec);
            return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                fmt::format("Cannot write resume state {}", tmp.string())));
        }
    }

    std::filesystem::rename(tmp, state_path(output_root), ec);
    if (ec) {
        return std::unexpected(infra::make_error_from(ec,
            fmt::format("Cannot replace resume state in {}", output_root.string())));
    }
    spdlog::debug("Saved {} completed tasks to {}", size(), state_path(output_root).string());
    return {};
}

} // namespace fdup::extensions
