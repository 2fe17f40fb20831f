#pragma once

#include "common_fixture.hpp"

#include <backend/connection_factory.hpp>
#include <backend/directory_lister.hpp>
#include <ftp/mocks/session_mock.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

using namespace std::chrono_literals;

namespace Test
{
    class DirectoryListerTests : public CommonFixture
    {
      protected:
        void SetUp() override
        {
            server_.addFile("/pub/b.txt", makeContent(10));
            server_.addFile("/pub/A.txt", makeContent(20));
            server_.addFile("/pub/c.iso", makeContent(30));
            server_.addDirectory("/pub/zeta");
            server_.addDirectory("/pub/Alpha");
            server_.addDirectory("/pub/beta");
        }

        std::unique_ptr<Ftp::ISession> connect()
        {
            ConnectionFactory factory{makeOptions().connectRetryPolicy(), server_.dialer()};
            auto session = factory.connect(endpoint_);
            if (!session)
                throw std::runtime_error("Failed to connect to fake server");
            return std::move(session).value();
        }

        DirectoryLister makeLister()
        {
            return DirectoryLister{makeOptions().listRetryPolicy()};
        }

        static std::vector<std::string> namesOf(std::vector<SharedData::DirectoryEntry> const& entries)
        {
            std::vector<std::string> names{};
            for (auto const& entry : entries)
                names.push_back(entry.name);
            return names;
        }
    };

    TEST_F(DirectoryListerTests, StructuredListingPutsDirectoriesFirstSortedCaseInsensitive)
    {
        auto session = connect();
        auto entries = makeLister().list(*session, "/pub");

        ASSERT_TRUE(entries.has_value()) << entries.error().toString();
        EXPECT_EQ(namesOf(*entries), (std::vector<std::string>{"Alpha", "beta", "zeta", "A.txt", "b.txt", "c.iso"}));
    }

    TEST_F(DirectoryListerTests, StructuredListingReportsSizesAndTimestamps)
    {
        auto session = connect();
        auto entries = makeLister().list(*session, "/pub");

        ASSERT_TRUE(entries.has_value());
        ASSERT_EQ(entries->size(), 6);
        for (auto const& entry : *entries)
        {
            EXPECT_TRUE(entry.modifiedTimestamp.has_value()) << entry.name;
            if (entry.isDirectory())
                EXPECT_FALSE(entry.size.has_value()) << entry.name;
        }
        EXPECT_EQ((*entries)[3].size, std::optional<std::uint64_t>{20});
        EXPECT_EQ((*entries)[5].size, std::optional<std::uint64_t>{30});
    }

    TEST_F(DirectoryListerTests, FallbackClassifiesByEnteringEveryName)
    {
        server_.setStructuredListingSupported(false);
        auto session = connect();
        auto entries = makeLister().list(*session, "/pub");

        ASSERT_TRUE(entries.has_value()) << entries.error().toString();
        EXPECT_EQ(namesOf(*entries), (std::vector<std::string>{"Alpha", "beta", "zeta", "A.txt", "b.txt", "c.iso"}));
        for (auto const& entry : *entries)
        {
            EXPECT_FALSE(entry.modifiedTimestamp.has_value());
            if (entry.isDirectory())
                EXPECT_FALSE(entry.size.has_value()) << entry.name;
            else
                EXPECT_TRUE(entry.size.has_value()) << entry.name;
        }
    }

    TEST_F(DirectoryListerTests, FallbackLeavesSessionInListedDirectory)
    {
        server_.setStructuredListingSupported(false);
        auto session = connect();
        auto lister = makeLister();
        ASSERT_TRUE(lister.list(*session, "/pub").has_value());

        EXPECT_EQ(lister.currentDirectory(*session), "/pub");
    }

    TEST_F(DirectoryListerTests, FallbackWithoutSizeSupportReportsUnknownSizes)
    {
        server_.setStructuredListingSupported(false);
        server_.setSizeSupported(false);
        auto session = connect();
        auto entries = makeLister().list(*session, "/pub");

        ASSERT_TRUE(entries.has_value());
        for (auto const& entry : *entries)
            EXPECT_FALSE(entry.size.has_value()) << entry.name;
    }

    TEST_F(DirectoryListerTests, TransientListingFailureIsRetried)
    {
        server_.failListings(1);
        auto session = connect();
        auto entries = makeLister().list(*session, "/pub");

        ASSERT_TRUE(entries.has_value());
        EXPECT_EQ(entries->size(), 6);
        EXPECT_EQ(sleeps(), (std::vector<std::chrono::milliseconds>{1000ms}));
    }

    TEST_F(DirectoryListerTests, RetryOfRelativePathEntersSameDirectory)
    {
        server_.failListings(1);
        auto session = connect();
        auto lister = makeLister();
        auto entries = lister.list(*session, "pub");

        ASSERT_TRUE(entries.has_value()) << entries.error().toString();
        EXPECT_EQ(namesOf(*entries), (std::vector<std::string>{"Alpha", "beta", "zeta", "A.txt", "b.txt", "c.iso"}));
        EXPECT_EQ(sleeps(), (std::vector<std::chrono::milliseconds>{1000ms}));
        EXPECT_EQ(lister.currentDirectory(*session), "/pub");
    }

    TEST_F(DirectoryListerTests, FallbackRetryOfRelativePathEntersSameDirectory)
    {
        server_.setStructuredListingSupported(false);
        server_.failListings(1);
        auto session = connect();
        auto lister = makeLister();
        auto entries = lister.list(*session, "pub");

        ASSERT_TRUE(entries.has_value()) << entries.error().toString();
        EXPECT_EQ(entries->size(), 6);
        EXPECT_EQ(lister.currentDirectory(*session), "/pub");
    }

    TEST_F(DirectoryListerTests, ExhaustedRetriesYieldProtocolError)
    {
        server_.failListings(10);
        auto session = connect();
        auto entries = makeLister().list(*session, "/pub");

        ASSERT_FALSE(entries.has_value());
        EXPECT_EQ(entries.error().type, SharedData::OperationErrorType::ProtocolError);
        EXPECT_EQ(entries.error().attempts, 2);
        ASSERT_TRUE(entries.error().ftpError.has_value());
        EXPECT_EQ(entries.error().ftpError->responseCode, 425);
    }

    TEST_F(DirectoryListerTests, MissingDirectoryIsProtocolError)
    {
        auto session = connect();
        auto entries = makeLister().list(*session, "/does/not/exist");

        ASSERT_FALSE(entries.has_value());
        EXPECT_EQ(entries.error().type, SharedData::OperationErrorType::ProtocolError);
    }

    TEST_F(DirectoryListerTests, EmptyDirectoryListsNothing)
    {
        server_.addDirectory("/empty");
        auto session = connect();
        auto entries = makeLister().list(*session, "/empty");

        ASSERT_TRUE(entries.has_value());
        EXPECT_TRUE(entries->empty());
    }

    TEST_F(DirectoryListerTests, CurrentDirectoryFollowsChanges)
    {
        auto session = connect();
        auto lister = makeLister();
        EXPECT_EQ(lister.currentDirectory(*session), "/");

        ASSERT_TRUE(session->changeDirectory("pub/zeta").has_value());
        EXPECT_EQ(lister.currentDirectory(*session), "/pub/zeta");
    }

    TEST_F(DirectoryListerTests, CurrentDirectoryFallsBackToRoot)
    {
        server_.setPrintWorkingDirectoryFails(true);
        auto session = connect();
        ASSERT_TRUE(session->changeDirectory("/pub").has_value());

        EXPECT_EQ(makeLister().currentDirectory(*session), "/");
    }

    TEST_F(DirectoryListerTests, FallbackEntersEachNameAndReturns)
    {
        using ::testing::_;
        using ::testing::Return;

        ::testing::StrictMock<Ftp::Test::SessionMock> session{};
        ::testing::InSequence sequence{};

        EXPECT_CALL(session, changeDirectory(std::string{"/data"}))
            .WillOnce(Return(std::expected<void, Ftp::FtpError>{}));
        EXPECT_CALL(session, enableStructuredListing())
            .WillOnce(Return(std::expected<void, Ftp::FtpError>{
                std::unexpected(Ftp::FtpError{.message = "500 Unknown command", .responseCode = 500})}));
        EXPECT_CALL(session, listNames())
            .WillOnce(Return(std::expected<std::vector<std::string>, Ftp::FtpError>{
                std::vector<std::string>{"sub", "file.bin"}}));
        EXPECT_CALL(session, changeDirectory(std::string{"sub"}))
            .WillOnce(Return(std::expected<void, Ftp::FtpError>{}));
        EXPECT_CALL(session, changeDirectory(std::string{".."}))
            .WillOnce(Return(std::expected<void, Ftp::FtpError>{}));
        EXPECT_CALL(session, changeDirectory(std::string{"file.bin"}))
            .WillOnce(Return(std::expected<void, Ftp::FtpError>{
                std::unexpected(Ftp::FtpError{.message = "550 Not a directory", .responseCode = 550})}));
        EXPECT_CALL(session, size(std::string{"file.bin"}))
            .WillOnce(Return(std::expected<std::uint64_t, Ftp::FtpError>{123}));

        auto entries = makeLister().list(session, "/data");

        ASSERT_TRUE(entries.has_value());
        ASSERT_EQ(entries->size(), 2);
        EXPECT_EQ((*entries)[0].name, "sub");
        EXPECT_TRUE((*entries)[0].isDirectory());
        EXPECT_FALSE((*entries)[0].size.has_value());
        EXPECT_EQ((*entries)[1].name, "file.bin");
        EXPECT_EQ((*entries)[1].size, std::optional<std::uint64_t>{123});
    }
}
