#include "args_parser.hpp"
#include "../../infra/config/config.hpp"
#include <CLI/CLI.hpp>

namespace fdup::args_parser {

namespace {

void assign_if_given(const CLI::Option* opt, std::int64_t value,
                     std::optional<std::int64_t>& target) {
    if (opt->count() > 0) {
        target = value;
    }
}

} // namespace

auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int> {
    CLI::App app{"fdup - duplicate files at scale"};

    CLIArgs args{};
    std::string sources;
    std::int64_t copies = 0;
    std::int64_t per_subfolder = 0;
    std::int64_t workers = infra::kDefaultWorkers;
    std::int64_t chunk_size = infra::kDefaultChunkSize;
    std::int64_t max_limit = infra::kDefaultMaxLimit;
    std::string config_path;

    app.add_option("--sources", sources, "Comma-separated source files");
    auto* copies_opt = app.add_option("--copies", copies, "Copies per source");
    app.add_option("--output", args.output, "Output directory");
    auto* per_subfolder_opt = app.add_option("--per-subfolder", per_subfolder,
        "Files per numbered subfolder (0 = no subfolders)")->capture_default_str();
    auto* workers_opt = app.add_option("--workers", workers, "Parallel workers")
        ->capture_default_str();
    auto* chunk_opt = app.add_option("--chunk-size", chunk_size, "Files per ZIP chunk")
        ->capture_default_str();
    auto* limit_opt = app.add_option("--max-limit", max_limit,
        "Refuse to plan more files than this")->capture_default_str();
    auto* config_opt = app.add_option("--config", config_path, "YAML config file");

    app.add_flag("--dry-run", args.dry_run, "Plan and count without writing anything");
    app.add_flag("--resume", args.resume, "Skip copies recorded in the resume state");
    app.add_flag("--randomize", args.randomize, "Random hex file names");
    app.add_flag("--zip", args.zip, "Pack the output into chunked ZIP archives");
    app.add_flag("--keep-going", args.keep_going,
        "Continue after a failed copy and report all failures at the end");
    app.add_flag("--no-progress", args.no_progress, "Disable the progress bar");
    app.add_flag("-q,--quiet", args.quiet, "Only print errors");
    app.add_flag("-v,--verbose", args.verbose, "Debug logging");
    app.add_flag("--version", args.version, "Print version and build info");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return std::unexpected(app.exit(e));
    }

    args.sources = infra::split_sources(sources);
    assign_if_given(copies_opt, copies, args.copies);
    assign_if_given(per_subfolder_opt, per_subfolder, args.per_subfolder);
    assign_if_given(workers_opt, workers, args.workers);
    assign_if_given(chunk_opt, chunk_size, args.chunk_size);
    assign_if_given(limit_opt, max_limit, args.max_limit);
    if (config_opt->count() > 0) {
        args.config_path = config_path;
    }
    return args;
}

} // namespace fdup::args_parser
