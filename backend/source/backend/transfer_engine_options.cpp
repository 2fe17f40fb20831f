#include <backend/transfer_engine_options.hpp>

#include <log/log.hpp>

#include <algorithm>

TransferEngineOptions makeEngineOptions(Persistence::TransferOptions options)
{
    options.useDefaultsFrom(Persistence::TransferOptions::defaults());

    TransferEngineOptions engineOptions{};
    engineOptions.timeout = std::chrono::seconds{std::max(1, *options.timeoutSeconds)};
    engineOptions.connectRetries = std::max(1, *options.connectRetries);
    engineOptions.listRetries = std::max(1, *options.listRetries);
    engineOptions.downloadRetries = std::max(1, *options.downloadRetries);
    engineOptions.connectRetryDelay = std::chrono::milliseconds{std::max(0, *options.connectRetryDelayMilliseconds)};
    engineOptions.listRetryDelay = std::chrono::milliseconds{std::max(0, *options.listRetryDelayMilliseconds)};
    engineOptions.downloadRetryDelay = std::chrono::milliseconds{std::max(0, *options.downloadRetryDelayMilliseconds)};
    engineOptions.blockSize = std::max<std::uint64_t>(1, *options.blockSize);
    engineOptions.maxSegments = std::clamp(*options.maxSegments, 1, maxSegmentsLimit);
    engineOptions.segmentedThreshold = *options.segmentedThreshold;
    engineOptions.verifyPeer = *options.verifyPeer;
    return engineOptions;
}

void applyLogLevel(Persistence::OptionsFile const& options)
{
    if (!options.logLevel)
        return;

    const auto level = Log::levelFromString(*options.logLevel, Log::level());
    Log::setLevel(level);
    Log::debug("TransferEngineOptions: log level set to '{}'", Log::levelToString(level));
}
