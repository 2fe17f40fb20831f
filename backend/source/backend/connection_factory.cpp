#include <backend/connection_factory.hpp>
#include <ftp/curl_session.hpp>
#include <log/log.hpp>

ConnectionFactory::ConnectionFactory(TransferEngineOptions const& options)
    : ConnectionFactory{
          options.connectRetryPolicy(),
          [sessionOptions = Ftp::CurlSession::Options{
               .timeout = options.timeout,
               .blockSize = options.blockSize,
               .verifyPeer = options.verifyPeer,
           }](Ftp::ServerEndpoint const& endpoint) -> std::expected<std::unique_ptr<Ftp::ISession>, Ftp::FtpError> {
              auto session = Ftp::CurlSession::open(endpoint, sessionOptions);
              if (!session)
                  return std::unexpected(session.error());
              return std::unique_ptr<Ftp::ISession>{std::move(session).value()};
          }}
{}

ConnectionFactory::ConnectionFactory(RetryPolicy retryPolicy, Dialer dialer)
    : retryPolicy_{std::move(retryPolicy)}
    , dialer_{std::move(dialer)}
{}

std::expected<std::unique_ptr<Ftp::ISession>, SharedData::OperationError>
ConnectionFactory::connect(Ftp::ServerEndpoint const& endpoint)
{
    using ResultType = std::expected<std::unique_ptr<Ftp::ISession>, SharedData::OperationError>;

    if (!dialer_)
    {
        Log::error("ConnectionFactory: No dialer set.");
        return std::unexpected(SharedData::OperationError{.type = SharedData::OperationErrorType::ImplementationError});
    }

    return retryPolicy_.run("ConnectionFactory", [&](int attempt) -> ResultType {
        Log::info(
            "ConnectionFactory: Connecting to {}:{} (attempt {}/{}).",
            endpoint.host,
            endpoint.port,
            attempt,
            retryPolicy_.attempts());

        auto session = dialer_(endpoint);
        if (!session)
        {
            return std::unexpected(SharedData::OperationError{
                .type = SharedData::OperationErrorType::ConnectionError,
                .ftpError = session.error(),
            });
        }
        return std::move(session).value();
    });
}
