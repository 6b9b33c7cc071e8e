#pragma once

#include <filesystem>
#include "../infra/error_handler/error.hpp"

namespace fdup::extensions {

// Переносит время модификации и права доступа с src на dst
[[nodiscard]] auto copy_metadata(const std::filesystem::path& src,
                                 const std::filesystem::path& dst)
    -> infra::VoidResult;

} // namespace fdup::extensions
