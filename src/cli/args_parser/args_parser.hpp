#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <expected>

namespace fdup::args_parser {

struct CLIArgs
{
    std::vector<std::string> sources;           // --sources a,b,c
    std::optional<std::int64_t> copies;         // --copies N
    std::string output;                         // --output DIR
    std::optional<std::int64_t> per_subfolder;  // --per-subfolder N
    std::optional<std::int64_t> workers;        // --workers N
    std::optional<std::int64_t> chunk_size;     // --chunk-size N
    std::optional<std::int64_t> max_limit;      // --max-limit N
    std::optional<std::string> config_path;     // --config FILE
    bool dry_run{false};                        // --dry-run
    bool resume{false};                         // --resume
    bool randomize{false};                      // --randomize
    bool zip{false};                            // --zip
    bool keep_going{false};                     // --keep-going
    bool no_progress{false};                    // --no-progress
    bool quiet{false};                          // -q, --quiet
    bool verbose{false};                        // -v, --verbose
    bool version{false};                        // --version

    /// Без --sources параметры спрашиваются интерактивно
    [[nodiscard]] bool wants_interactive() const { return sources.empty(); }
};

/// Parses command-line arguments.
/// On --help or a parse error CLI11 prints the message and the error side
/// carries the process exit code (0 for --help).
[[nodiscard]] auto parse_args(int argc, char const* const* argv)
    -> std::expected<CLIArgs, int>;

} // namespace fdup::args_parser
