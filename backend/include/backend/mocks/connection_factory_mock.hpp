#pragma once

#include <backend/connection_factory_interface.hpp>

#include <gmock/gmock.h>

namespace Test
{
    class ConnectionFactoryMock : public IConnectionFactory
    {
      public:
        MOCK_METHOD(
            (std::expected<std::unique_ptr<Ftp::ISession>, SharedData::OperationError>),
            connect,
            (Ftp::ServerEndpoint const& endpoint),
            (override));
    };
}
