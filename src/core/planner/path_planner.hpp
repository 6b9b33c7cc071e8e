#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "copy_task.hpp"
#include "../../infra/error_handler/error.hpp"

namespace fdup::core {

// Генератор случайных имён: 32 hex-символа (128 бит)
using IdGenerator = std::function<std::string()>;

[[nodiscard]] auto random_hex_id() -> std::string;

// Имя подкаталога для copy_index, либо пустая строка при per_subfolder == 0
[[nodiscard]] auto partition_name(std::uint64_t copy_index, std::uint64_t per_subfolder)
    -> std::string;

/// Строит полный список задач без обращения к диску (кроме проверки источников).
/// Для каждого источника по порядку и i = 1..copies:
///   последовательный режим: <stem>_<i><ext>, id = путь относительно output_root
///   случайный режим:        <random-id><ext>, id = random-id
/// Каталог: output_root или output_root/part_<n>, n = (i - 1) / per_subfolder + 1.
class PathPlanner {
public:
    explicit PathPlanner(std::filesystem::path output_root,
                         IdGenerator id_generator = random_hex_id);

    [[nodiscard]] auto plan(const std::vector<std::filesystem::path>& sources,
                            std::uint64_t copies,
                            std::uint64_t per_subfolder,
                            bool randomize) const
        -> infra::Result<std::vector<CopyTask>>;

    // SourceNotFound, если хоть один источник не обычный файл
    [[nodiscard]] static auto validate_sources(const std::vector<std::filesystem::path>& sources)
        -> infra::VoidResult;

private:
    std::filesystem::path output_root_;
    IdGenerator id_generator_;
};

} // namespace fdup::core
