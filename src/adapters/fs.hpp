#pragma once

#include <filesystem>
#include <cstdint>
#include "infra/error_handler/error.hpp"

namespace fdup::adapters::fs {

enum class CopyStrategy {
    Buffered,    // < 1 MB
    MMap,        // 1 MB .. 100 MB
    Uring,       // >= 100 MB (Linux io_uring, иначе Buffered)
};

[[nodiscard]] auto select_strategy(std::uintmax_t file_size) -> CopyStrategy;

// Копирует содержимое src в dst. dst создаётся или усекается.
[[nodiscard]] auto copy_file(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    CopyStrategy strategy = CopyStrategy::Buffered
) -> infra::VoidResult;

[[nodiscard]] auto copy_file_buffered(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult;

[[nodiscard]] auto copy_file_mmap(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult;

[[nodiscard]] auto copy_file_uring(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult;

// Идемпотентное "создать, если нет". Проигранная гонка с другим потоком
// не ошибка; обрыв посреди гонки отдаётся как transient DirectoryRace.
[[nodiscard]] auto ensure_directory(const std::filesystem::path& dir) -> infra::VoidResult;

} // namespace fdup::adapters::fs
