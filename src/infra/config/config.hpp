#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <filesystem>
#include "../error_handler/error.hpp"

namespace fdup::args_parser {
    struct CLIArgs;
}

namespace fdup::infra {

enum class FailurePolicy {
    FailFast,    // первая ошибка отменяет оставшиеся задачи
    BestEffort,  // все ошибки собираются, отчёт в конце
};

// Сырые параметры одного слоя (файл, CLI или интерактивный ввод).
// Числа знаковые: отрицательные значения отсекаются в validate_config().
struct Config {
    std::vector<std::string> sources;
    std::optional<std::int64_t> copies;
    std::string output;

    std::optional<std::int64_t> per_subfolder;
    std::optional<std::int64_t> workers;
    std::optional<std::int64_t> chunk_size;
    std::optional<std::int64_t> max_limit;

    // Behavior
    bool dry_run = false;
    bool resume = false;
    bool randomize = false;
    bool zip = false;
    bool keep_going = false;
    bool progress = true;
    bool quiet = false;
    std::optional<std::string> log_level;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);
};

// Проверенный набор параметров, который потребляет Orchestrator
struct RunConfig {
    std::vector<std::filesystem::path> sources;
    std::uint64_t copies = 0;
    std::filesystem::path output;
    std::uint64_t per_subfolder = 0;
    std::size_t workers = 4;
    std::size_t chunk_size = 5000;
    std::uint64_t max_limit = 50000;

    bool dry_run = false;
    bool resume = false;
    bool randomize = false;
    bool zip = false;
    FailurePolicy failure_policy = FailurePolicy::FailFast;
};

inline constexpr std::int64_t kDefaultWorkers = 4;
inline constexpr std::int64_t kMaxWorkers = 256;
inline constexpr std::int64_t kDefaultChunkSize = 5000;
inline constexpr std::int64_t kDefaultMaxLimit = 50000;

/// Загружает конфигурацию из файла YAML.
/// Если explicit_path задан, читается только он (и он обязан существовать).
/// Иначе ищет файл в порядке:
///   1. ./.fdup.yaml
///   2. $XDG_CONFIG_HOME/fdup/config.yaml или ~/.config/fdup/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file(
    const std::optional<std::filesystem::path>& explicit_path = std::nullopt)
    -> Result<Config>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const fdup::args_parser::CLIArgs& args) -> Config;

/// Разбивает "a.txt, b.txt" на отдельные пути, пустые элементы отбрасываются
[[nodiscard]] auto split_sources(std::string_view list) -> std::vector<std::string>;

/// Проверяет слитый Config и подставляет значения по умолчанию
[[nodiscard]] auto validate_config(const Config& config) -> Result<RunConfig>;

} // namespace fdup::infra
