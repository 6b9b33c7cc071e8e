#include "safety_guard.hpp"
#include <limits>
#include <fmt/core.h>

namespace fdup::core {

auto SafetyGuard::check(std::uint64_t task_count, std::uint64_t max_limit)
    -> infra::VoidResult
{
    if (task_count > max_limit) {
        return std::unexpected(infra::make_error(infra::ErrorCode::LimitExceeded,
            fmt::format("Requested {} files exceeds limit {}", task_count, max_limit)));
    }
    return {};
}

auto SafetyGuard::checked_product(std::uint64_t a, std::uint64_t b)
    -> std::optional<std::uint64_t>
{
    if (a != 0 && b > std::numeric_limits<std::uint64_t>::max() / a) {
        return std::nullopt;
    }
    return a * b;
}

auto SafetyGuard::check_request(std::uint64_t source_count,
                                std::uint64_t copies,
                                std::uint64_t max_limit)
    -> infra::VoidResult
{
    const auto total = checked_product(source_count, copies);
    if (!total) {
        return std::unexpected(infra::make_error(infra::ErrorCode::LimitExceeded,
            fmt::format("Requested {} x {} files overflows, limit is {}",
                        source_count, copies, max_limit)));
    }
    return check(*total, max_limit);
}

} // namespace fdup::core
