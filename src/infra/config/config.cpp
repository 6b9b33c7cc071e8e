#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <system_error>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace fdup::infra {
    void Config::merge_with(const Config& other) {
        if (!other.sources.empty()) sources = other.sources;
        if (other.copies) copies = other.copies;
        if (!other.output.empty()) output = other.output;

        if (other.per_subfolder) per_subfolder = other.per_subfolder;
        if (other.workers) workers = other.workers;
        if (other.chunk_size) chunk_size = other.chunk_size;
        if (other.max_limit) max_limit = other.max_limit;

        if (other.dry_run) dry_run = true;
        if (other.resume) resume = true;
        if (other.randomize) randomize = true;
        if (other.zip) zip = true;
        if (other.keep_going) keep_going = true;
        if (!other.progress) progress = false; // CLI может отключить
        if (other.quiet) quiet = true;
        if (other.log_level) log_level = other.log_level;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".fdup.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "fdup" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "fdup" / "config.yaml");
            }
        }

        return paths;
    }

    static auto parse_config_file(const std::filesystem::path& path) -> Result<Config> {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};
            if (!config || config.IsNull()) {
                return cfg; // пустой файл = нет настроек
            }
            if (!config.IsMap()) {
                return std::unexpected(make_error(ErrorCode::InvalidInput,
                    fmt::format("Config {} must be a mapping", path.string())));
            }

            if (config["workers"]) cfg.workers = config["workers"].as<std::int64_t>();
            if (config["per_subfolder"]) cfg.per_subfolder = config["per_subfolder"].as<std::int64_t>();
            if (config["chunk_size"]) cfg.chunk_size = config["chunk_size"].as<std::int64_t>();
            if (config["max_limit"]) cfg.max_limit = config["max_limit"].as<std::int64_t>();

            if (config["dry_run"]) cfg.dry_run = config["dry_run"].as<bool>();
            if (config["resume"]) cfg.resume = config["resume"].as<bool>();
            if (config["randomize"]) cfg.randomize = config["randomize"].as<bool>();
            if (config["zip"]) cfg.zip = config["zip"].as<bool>();
            if (config["keep_going"]) cfg.keep_going = config["keep_going"].as<bool>();
            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
            if (config["log_level"]) cfg.log_level = config["log_level"].as<std::string>();

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const YAML::Exception& e) {
            return std::unexpected(make_error(ErrorCode::InvalidInput,
                fmt::format("Failed to parse {}: {}", path.string(), e.what())));
        }
    }

    auto load_config_from_file(const std::optional<std::filesystem::path>& explicit_path)
        -> Result<Config>
    {
        if (explicit_path) {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(*explicit_path, ec)) {
                return std::unexpected(make_error(ErrorCode::InvalidInput,
                    fmt::format("Config file not found: {}", explicit_path->string())));
            }
            return parse_config_file(*explicit_path);
        }

        for (const auto& path : get_config_paths()) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) continue;
            return parse_config_file(path);
        }

        // Файл не найден: пустой конфиг, не ошибка
        return Config{};
    }

    [[nodiscard]]
    auto config_from_cli(const fdup::args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.sources = args.sources;
        cfg.copies = args.copies;
        cfg.output = args.output;
        cfg.per_subfolder = args.per_subfolder;
        cfg.workers = args.workers;
        cfg.chunk_size = args.chunk_size;
        cfg.max_limit = args.max_limit;
        cfg.dry_run = args.dry_run;
        cfg.resume = args.resume;
        cfg.randomize = args.randomize;
        cfg.zip = args.zip;
        cfg.keep_going = args.keep_going;
        cfg.progress = !args.no_progress;
        cfg.quiet = args.quiet;
        if (args.verbose) cfg.log_level = "debug";
        return cfg;
    }

    auto split_sources(std::string_view list) -> std::vector<std::string> {
        constexpr std::string_view whitespace = " \t\r\n";
        std::vector<std::string> out;

        std::size_t start = 0;
        while (start <= list.size()) {
            auto end = list.find(',', start);
            if (end == std::string_view::npos) end = list.size();

            auto item = list.substr(start, end - start);
            const auto first = item.find_first_not_of(whitespace);
            if (first != std::string_view::npos) {
                const auto last = item.find_last_not_of(whitespace);
                out.emplace_back(item.substr(first, last - first + 1));
            }
            start = end + 1;
        }
        return out;
    }

    auto validate_config(const Config& config) -> Result<RunConfig> {
        auto invalid = [](std::string_view msg) {
            return std::unexpected(make_error(ErrorCode::InvalidInput, msg));
        };

        if (config.sources.empty()) return invalid("No source files provided");
        if (!config.copies) return invalid("Number of copies is required");
        if (*config.copies <= 0) return invalid("copies must be > 0");
        if (config.output.empty()) return invalid("Output directory is required");

        const auto per_subfolder = config.per_subfolder.value_or(0);
        const auto workers = config.workers.value_or(kDefaultWorkers);
        const auto chunk_size = config.chunk_size.value_or(kDefaultChunkSize);
        const auto max_limit = config.max_limit.value_or(kDefaultMaxLimit);

        if (per_subfolder < 0) return invalid("per_subfolder must be >= 0");
        if (workers <= 0) return invalid("workers must be > 0");
        if (workers > kMaxWorkers) {
            return invalid(fmt::format("workers must be <= {}", kMaxWorkers));
        }
        if (chunk_size <= 0) return invalid("chunk_size must be > 0");
        if (max_limit < 0) return invalid("max_limit must be >= 0");

        RunConfig run{};
        for (const auto& src : config.sources) {
            run.sources.emplace_back(src);
        }
        run.copies = static_cast<std::uint64_t>(*config.copies);
        run.output = config.output;
        run.per_subfolder = static_cast<std::uint64_t>(per_subfolder);
        run.workers = static_cast<std::size_t>(workers);
        run.chunk_size = static_cast<std::size_t>(chunk_size);
        run.max_limit = static_cast<std::uint64_t>(max_limit);
        run.dry_run = config.dry_run;
        run.resume = config.resume;
        run.randomize = config.randomize;
        run.zip = config.zip;
        run.failure_policy = config.keep_going ? FailurePolicy::BestEffort
                                               : FailurePolicy::FailFast;
        return run;
    }

} // namespace fdup::infra
