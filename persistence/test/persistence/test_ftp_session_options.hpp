#pragma once

#include <persistence/state/ftp_session_options.hpp>

#include <gtest/gtest.h>

namespace Persistence::Test
{
    class FtpSessionOptionsTests : public ::testing::Test
    {};

    TEST_F(FtpSessionOptionsTests, ReadsAllFields)
    {
        const auto json = nlohmann::json::parse(R"({
            "host": "ftp.example.org",
            "port": 2121,
            "user": "alice",
            "password": "secret",
            "useEncryptedTransport": true,
            "passiveMode": false,
            "defaultDirectory": "/pub"
        })");

        const auto options = json.get<FtpSessionOptions>();

        EXPECT_EQ(options.host, "ftp.example.org");
        EXPECT_EQ(options.port, 2121);
        EXPECT_EQ(options.user, "alice");
        EXPECT_EQ(options.password, "secret");
        EXPECT_EQ(options.useEncryptedTransport, true);
        EXPECT_EQ(options.passiveMode, false);
        EXPECT_EQ(options.defaultDirectory, "/pub");
    }

    TEST_F(FtpSessionOptionsTests, UseDefaultsFromKeepsOwnValues)
    {
        FtpSessionOptions options{};
        options.port = 990;

        FtpSessionOptions defaults{};
        defaults.host = "fallback.example.org";
        defaults.port = 21;
        defaults.user = "anonymous";

        options.useDefaultsFrom(defaults);

        EXPECT_EQ(options.host, "fallback.example.org");
        EXPECT_EQ(options.port, 990);
        EXPECT_EQ(options.user, "anonymous");
        EXPECT_FALSE(options.password.has_value());
    }

    TEST_F(FtpSessionOptionsTests, WritesHostAndPresentFields)
    {
        FtpSessionOptions options{};
        options.host = "ftp.example.org";
        options.passiveMode = true;

        const nlohmann::json json = options;

        EXPECT_EQ(json["host"], "ftp.example.org");
        EXPECT_EQ(json["passiveMode"], true);
        EXPECT_FALSE(json.contains("port"));
        EXPECT_FALSE(json.contains("password"));
    }
}
