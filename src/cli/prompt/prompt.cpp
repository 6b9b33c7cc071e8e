#include "prompt.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <functional>
#include <optional>
#include <string>

namespace fdup::prompt {

namespace {

using Validator = std::function<bool(const std::string&)>;

auto trim(std::string s) -> std::string {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

auto parse_int(const std::string& s) -> std::optional<std::int64_t> {
    std::int64_t value = 0;
    const auto* end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

bool is_non_negative_int(const std::string& s) {
    auto v = parse_int(s);
    return v && *v >= 0;
}

bool is_positive_int(const std::string& s) {
    auto v = parse_int(s);
    return v && *v > 0;
}

bool is_yes_no(const std::string& s) {
    return s == "y" || s == "n" || s == "Y" || s == "N";
}

class Prompter {
public:
    Prompter(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

    auto ask(std::string_view msg, const Validator& validator,
             std::optional<std::string> def = std::nullopt) -> infra::Result<std::string>
    {
        while (true) {
            if (def) {
                out_ << fmt::format("{} [{}]: ", msg, *def);
            } else {
                out_ << fmt::format("{}: ", msg);
            }
            out_.flush();

            std::string line;
            if (!std::getline(in_, line)) {
                return std::unexpected(infra::make_error(infra::ErrorCode::InvalidInput,
                    fmt::format("Input ended while asking for '{}'", msg)));
            }
            line = trim(std::move(line));
            if (line.empty() && def) {
                return *def;
            }
            if (!line.empty() && (!validator || validator(line))) {
                return line;
            }
            out_ << "Invalid value, try again.\n";
        }
    }

    auto ask_int(std::string_view msg, const Validator& validator,
                 std::optional<std::int64_t> def = std::nullopt) -> infra::Result<std::int64_t>
    {
        std::optional<std::string> def_str;
        if (def) def_str = std::to_string(*def);
        auto answer = ask(msg, validator, def_str);
        if (!answer) return std::unexpected(std::move(answer.error()));
        return *parse_int(*answer);
    }

    auto ask_bool(std::string_view msg) -> infra::Result<bool> {
        auto answer = ask(fmt::format("{} (y/n)", msg), is_yes_no, std::string("n"));
        if (!answer) return std::unexpected(std::move(answer.error()));
        return *answer == "y" || *answer == "Y";
    }

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace

auto prompt_config(std::istream& in, std::ostream& out) -> infra::Result<infra::Config> {
    Prompter p(in, out);
    infra::Config cfg{};

    auto sources = p.ask("Source file(s) (comma-separated)",
        [](const std::string& s) { return !infra::split_sources(s).empty(); });
    if (!sources) return std::unexpected(std::move(sources.error()));
    cfg.sources = infra::split_sources(*sources);

    auto copies = p.ask_int("Copies per source", is_positive_int);
    if (!copies) return std::unexpected(std::move(copies.error()));
    cfg.copies = *copies;

    auto output = p.ask("Output directory", nullptr);
    if (!output) return std::unexpected(std::move(output.error()));
    cfg.output = *output;

    auto per_subfolder = p.ask_int("Files per subfolder (0 = none)", is_non_negative_int, 0);
    if (!per_subfolder) return std::unexpected(std::move(per_subfolder.error()));
    cfg.per_subfolder = *per_subfolder;

    auto workers = p.ask_int("Parallel workers", is_positive_int, infra::kDefaultWorkers);
    if (!workers) return std::unexpected(std::move(workers.error()));
    cfg.workers = *workers;

    struct BoolQuestion { std::string_view text; bool infra::Config::* field; };
    const BoolQuestion questions[] = {
        {"Dry-run?", &infra::Config::dry_run},
        {"Resume mode?", &infra::Config::resume},
        {"Randomize filenames?", &infra::Config::randomize},
        {"Zip output?", &infra::Config::zip},
    };
    for (const auto& q : questions) {
        auto answer = p.ask_bool(q.text);
        if (!answer) return std::unexpected(std::move(answer.error()));
        cfg.*(q.field) = *answer;
    }

    auto chunk_size = p.ask_int("ZIP chunk size", is_positive_int, infra::kDefaultChunkSize);
    if (!chunk_size) return std::unexpected(std::move(chunk_size.error()));
    cfg.chunk_size = *chunk_size;

    auto max_limit = p.ask_int("Max safety limit", is_non_negative_int, infra::kDefaultMaxLimit);
    if (!max_limit) return std::unexpected(std::move(max_limit.error()));
    cfg.max_limit = *max_limit;

    return cfg;
}

} // namespace fdup::prompt
