#pragma once

#include <persistence/options_file.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <fstream>

namespace Persistence::Test
{
    class OptionsFileTests : public ::testing::Test
    {
      protected:
        std::filesystem::path writeOptions(std::string const& content)
        {
            const auto path = tempDir_.path() / "options.json";
            std::ofstream{path, std::ios::binary} << content;
            return path;
        }

        Utility::TemporaryDirectory tempDir_{};
    };

    TEST_F(OptionsFileTests, LoadAppliesTransferDefaults)
    {
        const auto path = writeOptions(R"({
            "session": {"host": "ftp.example.org", "user": "bob"},
            "transfer": {"maxSegments": 4},
            "logLevel": "debug"
        })");

        const auto options = loadOptionsFile(path);

        ASSERT_TRUE(options.has_value()) << options.error();
        EXPECT_EQ(options->session.host, "ftp.example.org");
        EXPECT_EQ(options->session.user, "bob");
        EXPECT_EQ(options->transfer.maxSegments, 4);
        EXPECT_EQ(options->transfer.downloadRetries, 4);
        EXPECT_EQ(options->transfer.timeoutSeconds, 15);
        EXPECT_EQ(options->logLevel, "debug");
    }

    TEST_F(OptionsFileTests, EmptyObjectYieldsDefaults)
    {
        const auto options = loadOptionsFile(writeOptions("{}"));

        ASSERT_TRUE(options.has_value());
        EXPECT_TRUE(options->session.host.empty());
        EXPECT_EQ(options->transfer.segmentedThreshold, 655360u);
        EXPECT_FALSE(options->logLevel.has_value());
    }

    TEST_F(OptionsFileTests, MissingFileIsAnError)
    {
        const auto options = loadOptionsFile(tempDir_.path() / "does_not_exist.json");

        ASSERT_FALSE(options.has_value());
        EXPECT_NE(options.error().find("Cannot open"), std::string::npos);
    }

    TEST_F(OptionsFileTests, MalformedJsonIsAnError)
    {
        const auto options = loadOptionsFile(writeOptions("{\"session\": "));

        ASSERT_FALSE(options.has_value());
        EXPECT_NE(options.error().find("Malformed"), std::string::npos);
    }

    TEST_F(OptionsFileTests, WrongFieldTypeIsAnError)
    {
        const auto options = loadOptionsFile(writeOptions(R"({"transfer": {"maxSegments": "many"}})"));

        ASSERT_FALSE(options.has_value());
    }

    TEST_F(OptionsFileTests, NonObjectIsAnError)
    {
        const auto options = loadOptionsFile(writeOptions("[1, 2, 3]"));

        ASSERT_FALSE(options.has_value());
        EXPECT_NE(options.error().find("not a JSON object"), std::string::npos);
    }

    TEST_F(OptionsFileTests, SavedFileLoadsAgain)
    {
        OptionsFile options{};
        options.session.host = "ftp.example.org";
        options.session.port = 2121;
        options.transfer.maxSegments = 6;
        options.logLevel = "warning";

        const auto path = tempDir_.path() / "saved.json";
        ASSERT_TRUE(saveOptionsFile(path, options).has_value());

        const auto loaded = loadOptionsFile(path);
        ASSERT_TRUE(loaded.has_value()) << loaded.error();
        EXPECT_EQ(loaded->session.host, "ftp.example.org");
        EXPECT_EQ(loaded->session.port, 2121);
        EXPECT_EQ(loaded->transfer.maxSegments, 6);
        EXPECT_EQ(loaded->logLevel, "warning");
    }
}
