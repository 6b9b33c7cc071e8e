// metadata.cpp
#include <filesystem>
#include <fmt/core.h>
#include "metadata.hpp"

namespace fdup::extensions {

auto copy_metadata(const std::filesystem::path& src,
                   const std::filesystem::path& dst)
    -> infra::VoidResult
{
    std::error_code ec;

    // Временные метки
    const auto time = std::filesystem::last_write_time(src, ec);
    if (ec) {
        return std::unexpected(infra::make_error_from(ec,
            fmt::format("Cannot read mtime of {}", src.string())));
    }
    std::filesystem::last_write_time(dst, time, ec);
    if (ec) {
        return std::unexpected(infra::make_error_from(ec,
            fmt::format("Cannot set mtime of {}", dst.string())));
    }

    // Права (только POSIX)
#ifndef _WIN32
    const auto perms = std::filesystem::status(src, ec).permissions();
    if (!ec) {
        std::filesystem::permissions(dst, perms, std::filesystem::perm_options::replace, ec);
    }
    if (ec) {
        return std::unexpected(infra::make_error_from(ec,
            fmt::format("Metadata copy failed for {}", dst.string())));
    }
#endif

    return {};
}

} // namespace fdup::extensions
