#pragma once

#include <coderag/core/types.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <string_view>
#include <thread>
#include <type_traits>

namespace coderag {

/**
 * @brief Exponential backoff policy applied to transient failures only.
 */
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_delay{1000};
    double multiplier = 2.0;
    std::chrono::milliseconds max_delay{30000};

    std::chrono::milliseconds delayFor(int attempt) const {
        double delay = static_cast<double>(initial_delay.count());
        for (int i = 0; i < attempt; ++i) {
            delay *= multiplier;
        }
        auto ms = static_cast<long long>(delay);
        return std::min(std::chrono::milliseconds(ms), max_delay);
    }
};

/**
 * @brief Invoke fn until it succeeds, fails with a non-transient code, or attempts run out.
 *
 * fn must return a Result<T>. The last failure is returned unchanged.
 */
template <typename Fn>
auto retryWithBackoff(const RetryPolicy& policy, Fn&& fn, std::string_view label)
    -> std::invoke_result_t<Fn&> {
    int attempts = std::max(policy.max_attempts, 1);
    for (int attempt = 0;; ++attempt) {
        auto result = fn();
        if (result || !isTransient(result.error().code) || attempt + 1 >= attempts) {
            return result;
        }
        auto delay = policy.delayFor(attempt);
        spdlog::warn("{} failed ({}): retry {}/{} after {} ms", label, result.error().message,
                     attempt + 1, attempts - 1, delay.count());
        std::this_thread::sleep_for(delay);
    }
}

} // namespace coderag
