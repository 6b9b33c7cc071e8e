#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>
#include "../../infra/error_handler/error.hpp"

namespace fdup::core {

struct ArchiveChunk {
    std::uint64_t index = 0;          // с 1
    std::filesystem::path path;
    std::uint64_t entries = 0;
};

// Перекладывает дерево output_root в ZIP-архивы по chunk_size файлов.
// Архивы <имя-корня>_part<k>.zip пишутся рядом с корнем, в родительский каталог.
class ArchivePacker {
public:
    explicit ArchivePacker(std::uint64_t chunk_size);

    [[nodiscard]] auto pack(const std::filesystem::path& output_root) const
        -> infra::Result<std::vector<ArchiveChunk>>;

    /// Обычные файлы под root, пути относительно root в generic-форме, по возрастанию.
    /// Журнал возобновления в корне не попадает в список.
    [[nodiscard]] static auto collect_files(const std::filesystem::path& root)
        -> infra::Result<std::vector<std::filesystem::path>>;

    [[nodiscard]] static auto chunk_path(const std::filesystem::path& output_root,
                                         std::uint64_t index) -> std::filesystem::path;

private:
    auto write_chunk_(const std::filesystem::path& root,
                      const std::vector<std::filesystem::path>& files,
                      std::size_t first, std::size_t last,
                      const std::filesystem::path& archive) const -> infra::VoidResult;

    std::uint64_t chunk_size_;
};

} // namespace fdup::core
