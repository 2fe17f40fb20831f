#include <persistence/options_file.hpp>

#include <fmt/format.h>

#include <fstream>

namespace Persistence
{
    void to_json(nlohmann::json& j, OptionsFile const& options)
    {
        j = nlohmann::json::object();
        j["session"] = options.session;
        j["transfer"] = options.transfer;
        TO_JSON_OPTIONAL(j, options, logLevel);
    }
    void from_json(nlohmann::json const& j, OptionsFile& options)
    {
        options = {};
        if (j.contains("session"))
            j.at("session").get_to(options.session);
        if (j.contains("transfer"))
            j.at("transfer").get_to(options.transfer);
        FROM_JSON_OPTIONAL(j, options, logLevel);
    }

    std::expected<OptionsFile, std::string> loadOptionsFile(std::filesystem::path const& path)
    {
        std::ifstream reader{path, std::ios_base::binary};
        if (!reader.is_open())
            return std::unexpected(fmt::format("Cannot open options file '{}'", path.generic_string()));

        OptionsFile options{};
        try
        {
            const auto json = nlohmann::json::parse(reader);
            if (!json.is_object())
                return std::unexpected(fmt::format("Options file '{}' is not a JSON object", path.generic_string()));
            json.get_to(options);
        }
        catch (nlohmann::json::exception const& exc)
        {
            return std::unexpected(fmt::format("Malformed options file '{}': {}", path.generic_string(), exc.what()));
        }

        options.transfer.useDefaultsFrom(TransferOptions::defaults());
        return options;
    }

    std::expected<void, std::string> saveOptionsFile(std::filesystem::path const& path, OptionsFile const& options)
    {
        std::ofstream writer{path, std::ios_base::binary | std::ios_base::trunc};
        if (!writer.is_open())
            return std::unexpected(fmt::format("Cannot write options file '{}'", path.generic_string()));

        writer << nlohmann::json(options).dump(4);
        if (!writer.good())
            return std::unexpected(fmt::format("Failed writing options file '{}'", path.generic_string()));
        return {};
    }
}
