#include <persistence/state/ftp_session_options.hpp>

namespace Persistence
{
    void FtpSessionOptions::useDefaultsFrom(FtpSessionOptions const& other)
    {
        if (host.empty())
            host = other.host;
        Detail::fillIfUnset(port, other.port);
        Detail::fillIfUnset(user, other.user);
        Detail::fillIfUnset(password, other.password);
        Detail::fillIfUnset(useEncryptedTransport, other.useEncryptedTransport);
        Detail::fillIfUnset(passiveMode, other.passiveMode);
        Detail::fillIfUnset(defaultDirectory, other.defaultDirectory);
    }

    void to_json(nlohmann::json& j, FtpSessionOptions const& options)
    {
        j = {{"host", options.host}};

        TO_JSON_OPTIONAL(j, options, port);
        TO_JSON_OPTIONAL(j, options, user);
        TO_JSON_OPTIONAL(j, options, password);
        TO_JSON_OPTIONAL(j, options, useEncryptedTransport);
        TO_JSON_OPTIONAL(j, options, passiveMode);
        TO_JSON_OPTIONAL(j, options, defaultDirectory);
    }
    void from_json(nlohmann::json const& j, FtpSessionOptions& options)
    {
        options = {};

        FROM_JSON_OPTIONAL(j, options, port);
        FROM_JSON_OPTIONAL(j, options, user);
        FROM_JSON_OPTIONAL(j, options, password);
        FROM_JSON_OPTIONAL(j, options, useEncryptedTransport);
        FROM_JSON_OPTIONAL(j, options, passiveMode);
        FROM_JSON_OPTIONAL(j, options, defaultDirectory);
        if (j.contains("host"))
            j.at("host").get_to(options.host);
    }
}
