#include <ftp/server_endpoint.hpp>

namespace Ftp
{
    ServerEndpoint
    makeEndpoint(Persistence::FtpSessionOptions const& session, Persistence::TransferOptions const& transfer)
    {
        auto defaults = transfer;
        defaults.useDefaultsFrom(Persistence::TransferOptions::defaults());

        ServerEndpoint endpoint{};
        endpoint.host = session.host;
        endpoint.port = session.port.value_or(21);
        if (session.user && !session.user->empty())
            endpoint.username = *session.user;
        endpoint.password = session.password.value_or("");
        endpoint.useEncryptedTransport = session.useEncryptedTransport.value_or(*defaults.useEncryptedTransport);
        endpoint.passiveMode = session.passiveMode.value_or(*defaults.passiveMode);
        return endpoint;
    }
}
