#pragma once

#include "error_handler/error.hpp"
#include <chrono>
#include <cmath>
#include <thread>

namespace fdup::infra {
/*

auto res = infra::with_retry([&]() {
    return adapters::fs::ensure_directory(dir);
}, infra::RetryPolicy{ .max_attempts = 5 });

*/
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_delay = std::chrono::milliseconds(5);
    double backoff_factor = 2.0; // exponential backoff
};

// Повторяет операцию, пока ошибка transient и попытки не исчерпаны.
// operation() должна возвращать Result<T>.
template<typename F>
[[nodiscard]] auto with_retry(F&& operation, const RetryPolicy& policy = {})
    -> decltype(operation())
{
    const int attempts = policy.max_attempts > 0 ? policy.max_attempts : 1;

    auto result = operation();
    for (int attempt = 1; attempt < attempts; ++attempt) {
        if (result.has_value() || !result.error().is_transient()) {
            break;
        }

        // Экспоненциальная задержка
        const auto factor = std::pow(policy.backoff_factor, attempt - 1);
        const auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(
            policy.initial_delay * factor);
        std::this_thread::sleep_for(delay);

        spdlog::debug("Retrying after transient error (attempt {}/{}): {}",
                      attempt + 1, attempts, result.error().message);
        result = operation();
    }
    return result;
}

} // namespace fdup::infra
