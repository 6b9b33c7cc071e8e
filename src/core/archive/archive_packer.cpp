#include "archive_packer.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../extensions/resume_ledger.hpp"
#include "../../infra/interrupt.hpp"
#include "../../infra/zip/zip_writer.hpp"

namespace fdup::core {

namespace {

// /a/b/out/ -> /a/b/out
auto normalize_root(const std::filesystem::path& root) -> std::filesystem::path {
    std::error_code ec;
    auto abs = std::filesystem::absolute(root, ec);
    if (ec) {
        abs = root;
    }
    abs = abs.lexically_normal();
    if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path()) {
        abs = abs.parent_path();
    }
    return abs;
}

auto is_ledger_file(const std::filesystem::path& relative) -> bool {
    if (relative.has_parent_path()) {
        return false;
    }
    const auto name = relative.filename().string();
    return name == extensions::ResumeLedger::kStateFileName ||
           name == extensions::ResumeLedger::kTempFileName;
}

} // namespace

ArchivePacker::ArchivePacker(std::uint64_t chunk_size)
    : chunk_size_(chunk_size)
{}

auto ArchivePacker::chunk_path(const std::filesystem::path& output_root, std::uint64_t index)
    -> std::filesystem::path
{
    const auto root = normalize_root(output_root);
    return root.parent_path() / fmt::format("{}_part{}.zip", root.filename().string(), index);
}

auto ArchivePacker::collect_files(const std::filesystem::path& root)
    -> infra::Result<std::vector<std::filesystem::path>>
{
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(root, ec);
    if (ec) {
        return std::unexpected(infra::make_error_from(ec,
            fmt::format("Cannot list output directory {}", root.string())));
    }

    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return std::unexpected(infra::make_error_from(ec,
                fmt::format("Cannot list output directory {}", root.string())));
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        auto relative = it->path().lexically_relative(root);
        if (is_ledger_file(relative)) {
            continue;
        }
        files.push_back(std::move(relative));
    }
    if (ec) {
        return std::unexpected(infra::make_error_from(ec,
            fmt::format("Cannot list output directory {}", root.string())));
    }

    std::sort(files.begin(), files.end(),
        [](const std::filesystem::path& a, const std::filesystem::path& b) {
            return a.generic_string() < b.generic_string();
        });
    return files;
}

auto ArchivePacker::pack(const std::filesystem::path& output_root) const
    -> infra::Result<std::vector<ArchiveChunk>>
{
    if (chunk_size_ == 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidInput,
                                                 "chunk size must be > 0"));
    }

    const auto root = normalize_root(output_root);
    auto files = collect_files(root);
    if (!files) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ArchiveWriteFailure,
                                                 files.error().message));
    }

    std::vector<ArchiveChunk> chunks;
    if (files->empty()) {
        spdlog::info("Nothing to archive in {}", root.string());
        return chunks;
    }

    const std::size_t chunk = static_cast<std::size_t>(
        std::min<std::uint64_t>(chunk_size_, files->size()));
    const std::size_t total_chunks = (files->size() + chunk - 1) / chunk;
    spdlog::info("Packing {} files into {} archive(s)", files->size(), total_chunks);

    for (std::size_t first = 0, index = 1; first < files->size(); first += chunk, ++index) {
        const std::size_t last = std::min(first + chunk, files->size());
        const auto archive = chunk_path(root, index);

        // Недописанный архив ZipWriter не оставляет: при ошибке удалять нечего
        auto res = write_chunk_(root, *files, first, last, archive);
        if (!res) {
            return std::unexpected(infra::log_and_return(std::move(res.error())));
        }

        spdlog::debug("Archive {} written ({} entries)", archive.string(), last - first);
        chunks.push_back(ArchiveChunk{
            .index = index,
            .path = archive,
            .entries = last - first
        });
    }

    return chunks;
}

auto ArchivePacker::write_chunk_(const std::filesystem::path& root,
                                 const std::vector<std::filesystem::path>& files,
                                 std::size_t first, std::size_t last,
                                 const std::filesystem::path& archive) const
    -> infra::VoidResult
{
    infra::zip::ZipWriter writer{archive};
    if (auto res = writer.open(); !res) {
        return res;
    }
    for (std::size_t i = first; i < last; ++i) {
        if (infra::is_interrupted()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
                fmt::format("Interrupted while packing {}", archive.string())));
        }
        if (auto res = writer.add_file(root / files[i], files[i].generic_string()); !res) {
            return res;
        }
    }
    return writer.finish();
}

} // namespace fdup::core
