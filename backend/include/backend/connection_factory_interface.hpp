#pragma once

#include <ftp/server_endpoint.hpp>
#include <ftp/session_interface.hpp>
#include <shared_data/file_operations/operation_error.hpp>

#include <expected>
#include <memory>

class IConnectionFactory
{
  public:
    IConnectionFactory() = default;
    virtual ~IConnectionFactory() = default;
    IConnectionFactory(IConnectionFactory const&) = default;
    IConnectionFactory& operator=(IConnectionFactory const&) = default;
    IConnectionFactory(IConnectionFactory&&) = default;
    IConnectionFactory& operator=(IConnectionFactory&&) = default;

    /**
     * @brief Opens an authenticated control connection. The caller owns the session.
     *
     * @return The session or a ConnectionError.
     */
    virtual std::expected<std::unique_ptr<Ftp::ISession>, SharedData::OperationError>
    connect(Ftp::ServerEndpoint const& endpoint) = 0;
};
