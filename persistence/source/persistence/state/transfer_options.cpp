#include <persistence/state/transfer_options.hpp>

namespace Persistence
{
    TransferOptions TransferOptions::defaults()
    {
        constexpr std::uint64_t defaultBlockSize = 64 * 1024;

        return TransferOptions{
            .timeoutSeconds = 15,
            .connectRetries = 3,
            .listRetries = 2,
            .downloadRetries = 4,
            .connectRetryDelayMilliseconds = 1500,
            .listRetryDelayMilliseconds = 1000,
            .downloadRetryDelayMilliseconds = 1500,
            .blockSize = defaultBlockSize,
            .maxSegments = 8,
            .segmentedThreshold = defaultBlockSize * 10,
            .useEncryptedTransport = false,
            .passiveMode = true,
            .verifyPeer = true,
        };
    }

    void TransferOptions::useDefaultsFrom(TransferOptions const& other)
    {
        Detail::fillIfUnset(timeoutSeconds, other.timeoutSeconds);
        Detail::fillIfUnset(connectRetries, other.connectRetries);
        Detail::fillIfUnset(listRetries, other.listRetries);
        Detail::fillIfUnset(downloadRetries, other.downloadRetries);
        Detail::fillIfUnset(connectRetryDelayMilliseconds, other.connectRetryDelayMilliseconds);
        Detail::fillIfUnset(listRetryDelayMilliseconds, other.listRetryDelayMilliseconds);
        Detail::fillIfUnset(downloadRetryDelayMilliseconds, other.downloadRetryDelayMilliseconds);
        Detail::fillIfUnset(blockSize, other.blockSize);
        Detail::fillIfUnset(maxSegments, other.maxSegments);
        Detail::fillIfUnset(segmentedThreshold, other.segmentedThreshold);
        Detail::fillIfUnset(useEncryptedTransport, other.useEncryptedTransport);
        Detail::fillIfUnset(passiveMode, other.passiveMode);
        Detail::fillIfUnset(verifyPeer, other.verifyPeer);
    }

    void to_json(nlohmann::json& j, TransferOptions const& options)
    {
        j = nlohmann::json::object();

        TO_JSON_OPTIONAL(j, options, timeoutSeconds);
        TO_JSON_OPTIONAL(j, options, connectRetries);
        TO_JSON_OPTIONAL(j, options, listRetries);
        TO_JSON_OPTIONAL(j, options, downloadRetries);
        TO_JSON_OPTIONAL(j, options, connectRetryDelayMilliseconds);
        TO_JSON_OPTIONAL(j, options, listRetryDelayMilliseconds);
        TO_JSON_OPTIONAL(j, options, downloadRetryDelayMilliseconds);
        TO_JSON_OPTIONAL(j, options, blockSize);
        TO_JSON_OPTIONAL(j, options, maxSegments);
        TO_JSON_OPTIONAL(j, options, segmentedThreshold);
        TO_JSON_OPTIONAL(j, options, useEncryptedTransport);
        TO_JSON_OPTIONAL(j, options, passiveMode);
        TO_JSON_OPTIONAL(j, options, verifyPeer);
    }
    void from_json(nlohmann::json const& j, TransferOptions& options)
    {
        options = {};

        FROM_JSON_OPTIONAL(j, options, timeoutSeconds);
        FROM_JSON_OPTIONAL(j, options, connectRetries);
        FROM_JSON_OPTIONAL(j, options, listRetries);
        FROM_JSON_OPTIONAL(j, options, downloadRetries);
        FROM_JSON_OPTIONAL(j, options, connectRetryDelayMilliseconds);
        FROM_JSON_OPTIONAL(j, options, listRetryDelayMilliseconds);
        FROM_JSON_OPTIONAL(j, options, downloadRetryDelayMilliseconds);
        FROM_JSON_OPTIONAL(j, options, blockSize);
        FROM_JSON_OPTIONAL(j, options, maxSegments);
        FROM_JSON_OPTIONAL(j, options, segmentedThreshold);
        FROM_JSON_OPTIONAL(j, options, useEncryptedTransport);
        FROM_JSON_OPTIONAL(j, options, passiveMode);
        FROM_JSON_OPTIONAL(j, options, verifyPeer);
    }
}
