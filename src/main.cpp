#include <iostream>
#include <fmt/core.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "cli/prompt/prompt.hpp"
#include "core/orchestrator/orchestrator.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <chrono>

using GIT = fdup::build_info::GitInfo;
using ARGS = fdup::args_parser::CLIArgs;
using SUMMARY = fdup::core::RunSummary;

constexpr auto load_from_cli = fdup::infra::config_from_cli;
constexpr auto load_config_file = fdup::infra::load_config_from_file;
constexpr auto args_parser = fdup::args_parser::parse_args;
constexpr auto git = fdup::build_info::get_git_info();

static auto
__out_git_verse(const GIT& git)
-> void {
    fmt::print("fdup {}\n", git.version);
    fmt::print("Git branch: {}\n", git.branch);
    fmt::print("Git commit: {}\n", git.commit);
    fmt::print("Git dirty: {}\n", git.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", git.timestamp);
}

static auto
__out_summary_verse(const SUMMARY& summary, double seconds)
-> void {
    if (summary.dry_run) {
        fmt::print("[DRY-RUN] Would generate {} files\n", summary.processed);
        return;
    }
    fmt::print("SUCCESS: {} files processed\n", summary.processed);
    if (summary.skipped > 0) {
        fmt::print("Skipped (already done): {}\n", summary.skipped);
    }
    for (const auto& chunk : summary.archives) {
        fmt::print("Archive {}: {} ({} files)\n", chunk.index, chunk.path.string(), chunk.entries);
    }
    spdlog::info("Time elapsed: {:.2f} seconds", seconds);
}

// stderr, цветной, с единым шаблоном
static auto
__setup_logger(const ARGS& args)
-> void {
    auto logger = spdlog::stderr_color_mt("fdup");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

    if (args.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (args.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

int main(int argc, char** argv)
{
    try {
        auto args_opt = args_parser(argc, argv);
        if (!args_opt) {
            return args_opt.error(); // --help или ошибка разбора
        }
        const auto& args = *args_opt;

        if (args.version) {
            __out_git_verse(git);
            return 0;
        }

        __setup_logger(args);

        // 1. Загрузить из файла
        std::optional<std::filesystem::path> config_path;
        if (args.config_path) {
            config_path = *args.config_path;
        }
        auto config_res = load_config_file(config_path);
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error().message);
            return config_res.error().to_exit_code();
        }
        auto config = std::move(*config_res);

        // 2. Без --sources спрашиваем интерактивно
        if (args.wants_interactive()) {
            auto answers = fdup::prompt::prompt_config(std::cin, std::cout);
            if (!answers) {
                spdlog::error("{}", answers.error().message);
                return answers.error().to_exit_code();
            }
            config.merge_with(*answers);
        }

        // 3. Переопределить из CLI
        spdlog::debug("Merging CLI config with file config...");
        config.merge_with(load_from_cli(args)); // CLI имеет приоритет

        if (config.log_level && !args.verbose && !args.quiet) {
            spdlog::set_level(spdlog::level::from_str(*config.log_level));
        }
        if (config.quiet && !args.verbose) {
            spdlog::set_level(spdlog::level::warn);
        }

        auto run_config = fdup::infra::validate_config(config);
        if (!run_config) {
            spdlog::error("{}", run_config.error().message);
            return run_config.error().to_exit_code();
        }

        // Прогресс не рисуем в dry-run и в тихом режиме
        fdup::infra::NullProgress null_progress;
        fdup::infra::ProgressMonitor monitor(config.progress && !run_config->dry_run, config.quiet);
        fdup::infra::ProgressSink& progress = monitor.is_enabled()
            ? static_cast<fdup::infra::ProgressSink&>(monitor)
            : null_progress;

        fdup::core::Orchestrator orchestrator{std::move(*run_config)};

        // До этого места Ctrl-C завершает процесс сразу, в том числе во время вопросов
        fdup::infra::install_signal_handler();

        const auto start_time = std::chrono::steady_clock::now();
        auto result = orchestrator.run(progress);
        const auto elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_time).count();

        if (!result) {
            spdlog::error("{}", result.error().message);
            return result.error().to_exit_code();
        }

        __out_summary_verse(*result, elapsed);
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
