#pragma once

#include <shared_data/file_operations/operation_error.hpp>
#include <log/log.hpp>

#include <algorithm>
#include <chrono>
#include <expected>
#include <functional>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

/**
 * @brief Fixed attempt count retry with a delay that grows linearly with the attempt number.
 * Only transient errors are retried.
 */
class RetryPolicy
{
  public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    RetryPolicy(int attempts, std::chrono::milliseconds baseDelay, Sleeper sleeper = {})
        : attempts_{std::max(1, attempts)}
        , baseDelay_{std::max(std::chrono::milliseconds{0}, baseDelay)}
        , sleeper_{sleeper ? std::move(sleeper) : Sleeper{[](std::chrono::milliseconds delay) {
            std::this_thread::sleep_for(delay);
        }}}
    {}

    int attempts() const
    {
        return attempts_;
    }

    std::chrono::milliseconds baseDelay() const
    {
        return baseDelay_;
    }

    /**
     * @brief The pause after the given failed attempt (1 based).
     */
    std::chrono::milliseconds delayAfter(int attempt) const
    {
        return baseDelay_ * attempt;
    }

    /**
     * @brief Calls attemptFn(attemptNumber) until it succeeds, fails non-transiently or the attempts are used up.
     *
     * @param label Prefix for log messages, like "SingleStreamDownload".
     * @param attemptFn Callable taking the 1 based attempt number, returning std::expected<T, OperationError>.
     * @return The first success, or the last error with the number of attempts made.
     */
    template <typename FunctionT>
    std::invoke_result_t<FunctionT&, int> run(std::string_view label, FunctionT&& attemptFn) const
    {
        for (int attempt = 1;; ++attempt)
        {
            auto result = attemptFn(attempt);
            if (result.has_value())
                return result;

            auto error = std::move(result).error();
            error.attempts = attempt;

            if (!error.isTransient())
            {
                Log::error("{}: {}", label, error.toString());
                return std::unexpected(std::move(error));
            }

            if (attempt >= attempts_)
            {
                Log::error("{}: giving up: {}", label, error.toString());
                return std::unexpected(std::move(error));
            }

            const auto delay = delayAfter(attempt);
            Log::warn(
                "{}: attempt {}/{} failed, retrying in {} ms: {}",
                label,
                attempt,
                attempts_,
                delay.count(),
                error.toString());
            sleeper_(delay);
        }
    }

  private:
    int attempts_;
    std::chrono::milliseconds baseDelay_;
    Sleeper sleeper_;
};
