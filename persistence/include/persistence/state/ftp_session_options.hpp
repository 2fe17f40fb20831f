#pragma once

#include <persistence/state_core.hpp>

#include <optional>
#include <string>

namespace Persistence
{
    struct FtpSessionOptions
    {
        std::string host{};
        std::optional<int> port{std::nullopt};
        std::optional<std::string> user{std::nullopt};
        std::optional<std::string> password{std::nullopt};
        // Explicit TLS (AUTH TLS + PROT P). Falls back to TransferOptions::useEncryptedTransport when unset.
        std::optional<bool> useEncryptedTransport{std::nullopt};
        // Falls back to TransferOptions::passiveMode when unset.
        std::optional<bool> passiveMode{std::nullopt};
        std::optional<std::string> defaultDirectory{std::nullopt};

        void useDefaultsFrom(FtpSessionOptions const& other);
    };
    void to_json(nlohmann::json& j, FtpSessionOptions const& options);
    void from_json(nlohmann::json const& j, FtpSessionOptions& options);
}
