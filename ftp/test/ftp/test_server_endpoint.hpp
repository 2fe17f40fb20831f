#pragma once

#include <ftp/server_endpoint.hpp>

#include <gtest/gtest.h>

namespace Ftp::Test
{
    class ServerEndpointTests : public ::testing::Test
    {};

    TEST_F(ServerEndpointTests, UnsetSessionValuesUseDefaults)
    {
        Persistence::FtpSessionOptions session{};
        session.host = "ftp.example.org";

        const auto endpoint = makeEndpoint(session, Persistence::TransferOptions{});

        EXPECT_EQ(endpoint.host, "ftp.example.org");
        EXPECT_EQ(endpoint.port, 21);
        EXPECT_EQ(endpoint.username, "anonymous");
        EXPECT_EQ(endpoint.password, "");
        EXPECT_FALSE(endpoint.useEncryptedTransport);
        EXPECT_TRUE(endpoint.passiveMode);
    }

    TEST_F(ServerEndpointTests, SessionValuesTakePrecedence)
    {
        Persistence::FtpSessionOptions session{};
        session.host = "10.0.0.1";
        session.port = 2121;
        session.user = "alice";
        session.password = "secret";
        session.useEncryptedTransport = true;
        session.passiveMode = false;

        Persistence::TransferOptions transfer{};
        transfer.useEncryptedTransport = false;
        transfer.passiveMode = true;

        const auto endpoint = makeEndpoint(session, transfer);

        EXPECT_EQ(endpoint.port, 2121);
        EXPECT_EQ(endpoint.username, "alice");
        EXPECT_EQ(endpoint.password, "secret");
        EXPECT_TRUE(endpoint.useEncryptedTransport);
        EXPECT_FALSE(endpoint.passiveMode);
    }

    TEST_F(ServerEndpointTests, TransferOptionsFillGapsOfSession)
    {
        Persistence::FtpSessionOptions session{};
        session.host = "ftp.example.org";

        Persistence::TransferOptions transfer{};
        transfer.useEncryptedTransport = true;
        transfer.passiveMode = false;

        const auto endpoint = makeEndpoint(session, transfer);

        EXPECT_TRUE(endpoint.useEncryptedTransport);
        EXPECT_FALSE(endpoint.passiveMode);
    }

    TEST_F(ServerEndpointTests, EmptyUserFallsBackToAnonymous)
    {
        Persistence::FtpSessionOptions session{};
        session.host = "ftp.example.org";
        session.user = "";

        EXPECT_EQ(makeEndpoint(session, {}).username, "anonymous");
    }
}
