#pragma once

#include <persistence/state/transfer_options.hpp>

#include <gtest/gtest.h>

namespace Persistence::Test
{
    class TransferOptionsTests : public ::testing::Test
    {};

    TEST_F(TransferOptionsTests, DefaultsAreComplete)
    {
        const auto defaults = TransferOptions::defaults();
        EXPECT_EQ(defaults.timeoutSeconds, 15);
        EXPECT_EQ(defaults.connectRetries, 3);
        EXPECT_EQ(defaults.listRetries, 2);
        EXPECT_EQ(defaults.downloadRetries, 4);
        EXPECT_EQ(defaults.connectRetryDelayMilliseconds, 1500);
        EXPECT_EQ(defaults.listRetryDelayMilliseconds, 1000);
        EXPECT_EQ(defaults.downloadRetryDelayMilliseconds, 1500);
        EXPECT_EQ(defaults.blockSize, 65536u);
        EXPECT_EQ(defaults.maxSegments, 8);
        EXPECT_EQ(defaults.segmentedThreshold, 655360u);
        EXPECT_EQ(defaults.useEncryptedTransport, false);
        EXPECT_EQ(defaults.passiveMode, true);
        EXPECT_EQ(defaults.verifyPeer, true);
    }

    TEST_F(TransferOptionsTests, UseDefaultsFromOnlyFillsUnsetFields)
    {
        TransferOptions options{};
        options.downloadRetries = 9;
        options.passiveMode = false;

        options.useDefaultsFrom(TransferOptions::defaults());

        EXPECT_EQ(options.downloadRetries, 9);
        EXPECT_EQ(options.passiveMode, false);
        EXPECT_EQ(options.connectRetries, 3);
        EXPECT_EQ(options.blockSize, 65536u);
    }

    TEST_F(TransferOptionsTests, OnlyPresentFieldsAreWritten)
    {
        TransferOptions options{};
        options.maxSegments = 4;

        const nlohmann::json json = options;

        EXPECT_EQ(json.size(), 1u);
        EXPECT_EQ(json["maxSegments"], 4);
    }

    TEST_F(TransferOptionsTests, MissingAndNullFieldsStayUnset)
    {
        const auto json = nlohmann::json::parse(R"({"timeoutSeconds": 30, "blockSize": null})");

        const auto options = json.get<TransferOptions>();

        EXPECT_EQ(options.timeoutSeconds, 30);
        EXPECT_FALSE(options.blockSize.has_value());
        EXPECT_FALSE(options.maxSegments.has_value());
    }
}
