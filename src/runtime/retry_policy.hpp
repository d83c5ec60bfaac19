#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include "core/errors/pipeline_errors.hpp"
#include "core/logging/logger.hpp"

namespace seoflow::runtime {

using CancelToken = std::shared_ptr<std::atomic_bool>;

// Waits for `delay`; returns false if the wait was interrupted by cancellation.
using Sleeper = std::function<bool(std::chrono::milliseconds delay, const CancelToken& cancel)>;

inline bool is_cancelled(const CancelToken& cancel) {
    return cancel != nullptr && cancel->load();
}

// Sleeps in short slices so a cancelled run stops waiting promptly. Other
// orchestrators on other threads are never blocked.
inline bool sliced_sleep(const std::chrono::milliseconds delay, const CancelToken& cancel) {
    constexpr auto kSlice = std::chrono::milliseconds(50);
    const auto deadline = std::chrono::steady_clock::now() + delay;
    while (std::chrono::steady_clock::now() < deadline) {
        if (is_cancelled(cancel)) {
            return false;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(kSlice, std::max(remaining, std::chrono::milliseconds(0))));
    }
    return !is_cancelled(cancel);
}

inline core::errors::PipelineError cancelled_error(const std::string& where) {
    return core::errors::PipelineError{core::errors::ErrorCategory::Cancelled,
                                       "Workflow cancelled during " + where + ".",
                                       "cancelled"};
}

struct RetryPolicy {
    std::uint32_t max_attempts = 3;
    std::chrono::milliseconds initial_delay{1000};
    double multiplier = 2.0;
    std::chrono::milliseconds max_delay{60000};
    std::function<bool(const core::errors::PipelineError&)> retryable =
        [](const core::errors::PipelineError& err) {
            return err.category == core::errors::ErrorCategory::Transient;
        };

    // Delay before attempt `attempt + 1`, for attempt >= 1.
    std::chrono::milliseconds delay_for(std::uint32_t attempt) const {
        double delay = static_cast<double>(initial_delay.count());
        for (std::uint32_t i = 1; i < attempt; ++i) {
            delay *= multiplier;
            if (delay >= static_cast<double>(max_delay.count())) {
                return max_delay;
            }
        }
        return std::min(max_delay, std::chrono::milliseconds(static_cast<std::int64_t>(delay)));
    }

    // Runs op(attempt) with attempt starting at 1. Stops on success, on a
    // non-retryable error, or after max_attempts; the last error is returned.
    template <typename T>
    core::errors::Result<T> run(const std::string& label,
                                const std::function<core::errors::Result<T>(std::uint32_t)>& op,
                                const CancelToken& cancel = nullptr,
                                const Sleeper& sleeper = sliced_sleep) const {
        const std::uint32_t attempts = std::max<std::uint32_t>(1, max_attempts);
        for (std::uint32_t attempt = 1;; ++attempt) {
            if (is_cancelled(cancel)) {
                return cancelled_error(label);
            }

            auto result = op(attempt);
            if (!core::errors::is_error(result)) {
                return result;
            }

            const auto& err = core::errors::get_error(result);
            if (!retryable || !retryable(err)) {
                return result;
            }
            if (attempt >= attempts) {
                LOG_ERROR(label + ": giving up after " + std::to_string(attempt) +
                          " attempts: " + err.message);
                return result;
            }

            const auto delay = delay_for(attempt);
            LOG_WARN(label + ": retry " + std::to_string(attempt) + " after " +
                     std::to_string(delay.count()) + "ms (" + err.message + ")");
            if (!sleeper(delay, cancel)) {
                return cancelled_error(label);
            }
        }
    }
};

}  // namespace seoflow::runtime
