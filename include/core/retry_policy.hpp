#pragma once

#include <chrono>
#include <string>
#include <thread>
#include "logging/logger.hpp"

/**
 * @brief Bounded retry with a fixed delay between attempts
 *
 * Works on result structs exposing `success` and `error_message`; exceptions
 * are expected to be translated into such a result by the callee.
 */
class RetryPolicy
{
public:
    RetryPolicy(int max_attempts = 3, int backoff_ms = 1000)
        : max_attempts_(max_attempts < 1 ? 1 : max_attempts), backoff_ms_(backoff_ms < 0 ? 0 : backoff_ms) {}

    int getMaxAttempts() const { return max_attempts_; }
    int getBackoffMs() const { return backoff_ms_; }

    /**
     * @brief Invoke func until it succeeds or the attempt budget is spent
     * @param func Callable returning a result struct
     * @param operation_name Label used in log messages
     * @return The first successful result, or the last failed one
     */
    template <typename Func>
    auto run(Func func, const std::string &operation_name) const -> decltype(func())
    {
        auto result = func();
        for (int attempt = 1; attempt < max_attempts_ && !result.success; ++attempt)
        {
            Logger::warn("Operation '" + operation_name + "' failed, retrying in " +
                         std::to_string(backoff_ms_) + "ms (attempt " + std::to_string(attempt) +
                         "/" + std::to_string(max_attempts_) + "): " + result.error_message);
            if (backoff_ms_ > 0)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms_));
            }
            result = func();
        }

        if (!result.success)
        {
            Logger::error("Operation '" + operation_name + "' failed after " + std::to_string(max_attempts_) +
                          " attempts: " + result.error_message);
        }
        return result;
    }

private:
    int max_attempts_;
    int backoff_ms_;
};
