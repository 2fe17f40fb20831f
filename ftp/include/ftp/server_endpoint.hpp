#pragma once

#include <persistence/state/ftp_session_options.hpp>
#include <persistence/state/transfer_options.hpp>

#include <string>

namespace Ftp
{
    /**
     * @brief Where and how to connect. Does not change for the lifetime of a session.
     */
    struct ServerEndpoint
    {
        std::string host{};
        int port{21};
        std::string username{"anonymous"};
        std::string password{};
        bool useEncryptedTransport{false};
        bool passiveMode{true};
    };

    /**
     * @brief Builds an endpoint from persisted session options. Encryption and passive mode fall back to the
     * transfer options when the session does not specify them.
     */
    ServerEndpoint
    makeEndpoint(Persistence::FtpSessionOptions const& session, Persistence::TransferOptions const& transfer);
}
