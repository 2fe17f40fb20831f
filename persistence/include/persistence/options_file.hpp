#pragma once

#include <persistence/state/ftp_session_options.hpp>
#include <persistence/state/transfer_options.hpp>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace Persistence
{
    struct OptionsFile
    {
        FtpSessionOptions session{};
        TransferOptions transfer{};
        // Name understood by Log::levelFromString.
        std::optional<std::string> logLevel{std::nullopt};
    };
    void to_json(nlohmann::json& j, OptionsFile const& options);
    void from_json(nlohmann::json const& j, OptionsFile& options);

    /**
     * @brief Reads {"session": {...}, "transfer": {...}} from a JSON file. Unset transfer options are filled from
     * TransferOptions::defaults().
     *
     * @return The options or a description of why the file could not be used.
     */
    std::expected<OptionsFile, std::string> loadOptionsFile(std::filesystem::path const& path);

    std::expected<void, std::string> saveOptionsFile(std::filesystem::path const& path, OptionsFile const& options);
}
