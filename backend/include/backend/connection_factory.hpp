#pragma once

#include <backend/connection_factory_interface.hpp>
#include <backend/retry_policy.hpp>
#include <backend/transfer_engine_options.hpp>
#include <ftp/ftp_error.hpp>

#include <expected>
#include <functional>
#include <memory>

/**
 * @brief Connects with retries. Every attempt dials from scratch, a failed attempt leaves nothing open.
 */
class ConnectionFactory : public IConnectionFactory
{
  public:
    using Dialer =
        std::function<std::expected<std::unique_ptr<Ftp::ISession>, Ftp::FtpError>(Ftp::ServerEndpoint const&)>;

    /**
     * @brief Dials with libcurl using the timeouts and TLS verification of the options.
     */
    explicit ConnectionFactory(TransferEngineOptions const& options);

    ConnectionFactory(RetryPolicy retryPolicy, Dialer dialer);

    std::expected<std::unique_ptr<Ftp::ISession>, SharedData::OperationError>
    connect(Ftp::ServerEndpoint const& endpoint) override;

  private:
    RetryPolicy retryPolicy_;
    Dialer dialer_;
};
