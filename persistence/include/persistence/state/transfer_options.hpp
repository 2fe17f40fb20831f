#pragma once

#include <persistence/state_core.hpp>

#include <cstdint>
#include <optional>

namespace Persistence
{
    /**
     * @brief Tunables of the transfer engine. Unset fields take the values of defaults().
     */
    struct TransferOptions
    {
        std::optional<int> timeoutSeconds{std::nullopt};
        std::optional<int> connectRetries{std::nullopt};
        std::optional<int> listRetries{std::nullopt};
        std::optional<int> downloadRetries{std::nullopt};
        std::optional<int> connectRetryDelayMilliseconds{std::nullopt};
        std::optional<int> listRetryDelayMilliseconds{std::nullopt};
        std::optional<int> downloadRetryDelayMilliseconds{std::nullopt};
        std::optional<std::uint64_t> blockSize{std::nullopt};
        std::optional<int> maxSegments{std::nullopt};
        // Files larger than this are downloaded segmented when more than one segment is requested.
        std::optional<std::uint64_t> segmentedThreshold{std::nullopt};
        std::optional<bool> useEncryptedTransport{std::nullopt};
        std::optional<bool> passiveMode{std::nullopt};
        std::optional<bool> verifyPeer{std::nullopt};

        void useDefaultsFrom(TransferOptions const& other);

        static TransferOptions defaults();
    };
    void to_json(nlohmann::json& j, TransferOptions const& options);
    void from_json(nlohmann::json const& j, TransferOptions& options);
}
