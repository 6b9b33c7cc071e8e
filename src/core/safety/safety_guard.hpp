#pragma once

#include <cstdint>
#include <optional>
#include "../../infra/error_handler/error.hpp"

namespace fdup::core {

// Единственная проверка перед любым I/O: либо весь план, либо ничего
class SafetyGuard {
public:
    /// LimitExceeded, если task_count > max_limit
    [[nodiscard]] static auto check(std::uint64_t task_count, std::uint64_t max_limit)
        -> infra::VoidResult;

    /// sources * copies, nullopt при переполнении
    [[nodiscard]] static auto checked_product(std::uint64_t a, std::uint64_t b)
        -> std::optional<std::uint64_t>;

    /// Проверка запрошенного объёма до построения плана.
    /// Переполнение считается превышением лимита.
    [[nodiscard]] static auto check_request(std::uint64_t source_count,
                                            std::uint64_t copies,
                                            std::uint64_t max_limit)
        -> infra::VoidResult;
};

} // namespace fdup::core
