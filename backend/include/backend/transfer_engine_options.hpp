#pragma once

#include <backend/retry_policy.hpp>
#include <persistence/options_file.hpp>
#include <persistence/state/transfer_options.hpp>

#include <chrono>
#include <cstdint>
#include <stop_token>

// Hard upper bound for concurrent segment workers. The configured maxSegments may only lower it.
constexpr int maxSegmentsLimit = 8;

struct TransferEngineOptions
{
    std::chrono::seconds timeout{15};
    int connectRetries{3};
    int listRetries{2};
    int downloadRetries{4};
    std::chrono::milliseconds connectRetryDelay{1500};
    std::chrono::milliseconds listRetryDelay{1000};
    std::chrono::milliseconds downloadRetryDelay{1500};
    std::uint64_t blockSize{64 * 1024};
    int maxSegments{maxSegmentsLimit};
    std::uint64_t segmentedThreshold{64 * 1024 * 10};
    bool verifyPeer{true};
    // Polled between received chunks and before every attempt.
    std::stop_token stopToken{};
    // Used between retry attempts, sleeps for real when empty.
    RetryPolicy::Sleeper sleeper{};

    RetryPolicy connectRetryPolicy() const
    {
        return RetryPolicy{connectRetries, connectRetryDelay, sleeper};
    }

    RetryPolicy listRetryPolicy() const
    {
        return RetryPolicy{listRetries, listRetryDelay, sleeper};
    }

    RetryPolicy downloadRetryPolicy() const
    {
        return RetryPolicy{downloadRetries, downloadRetryDelay, sleeper};
    }

    bool stopRequested() const
    {
        return stopToken.stop_requested();
    }
};

/**
 * @brief Converts persisted options to engine options. Unset values take TransferOptions::defaults(), counts are
 * raised to at least 1 and maxSegments is clamped to maxSegmentsLimit.
 */
TransferEngineOptions makeEngineOptions(Persistence::TransferOptions options);

/**
 * @brief Sets the log level named in the options file. Keeps the current level when the name is absent or unknown.
 */
void applyLogLevel(Persistence::OptionsFile const& options);
