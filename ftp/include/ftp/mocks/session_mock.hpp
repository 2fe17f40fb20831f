#pragma once

#include <ftp/session_interface.hpp>

#include <gmock/gmock.h>

#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace Ftp::Test
{
    class SessionMock : public Ftp::ISession
    {
      public:
        MOCK_METHOD((std::expected<std::string, FtpError>), printWorkingDirectory, (), (override));
        MOCK_METHOD((std::expected<void, FtpError>), changeDirectory, (std::string const& path), (override));
        MOCK_METHOD((std::expected<std::uint64_t, FtpError>), size, (std::string const& path), (override));
        MOCK_METHOD((std::expected<void, FtpError>), enableStructuredListing, (), (override));
        MOCK_METHOD((std::expected<std::vector<std::string>, FtpError>), listStructured, (), (override));
        MOCK_METHOD((std::expected<std::vector<std::string>, FtpError>), listNames, (), (override));
        MOCK_METHOD(
            (std::expected<RetrieveResult, FtpError>),
            retrieve,
            (std::string const& remotePath, std::uint64_t offset, std::function<bool(std::string_view data)> onData),
            (override));
        MOCK_METHOD(void, close, (), (override));
        MOCK_METHOD(bool, isOpen, (), (const, override));
    };
}
