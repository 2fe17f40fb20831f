#pragma once

#include <ftp/ftp_error.hpp>
#include <ftp/session_interface.hpp>

#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>

/**
 * @brief Reads exactly quota bytes of a remote file starting at an offset, then drops the connection.
 *
 * Data beyond the quota is cut off. Reaching the quota is a regular outcome even though the server sees an
 * aborted transfer. The session is closed afterwards and must not be used again.
 */
class BoundedReader
{
  public:
    enum class Outcome
    {
        QuotaReached,
        // The server finished sending before the quota was reached.
        EndOfStream,
        // The data callback asked to stop.
        StoppedByConsumer,
    };

    struct Result
    {
        std::uint64_t bytesRead{0};
        Outcome outcome{Outcome::EndOfStream};
    };

    BoundedReader(Ftp::ISession& session, std::uint64_t quota);

    std::expected<Result, Ftp::FtpError> read(
        std::string const& remotePath,
        std::uint64_t offset,
        std::function<bool(std::string_view data)> const& onData);

    std::uint64_t quota() const
    {
        return quota_;
    }

    std::uint64_t remaining() const
    {
        return quota_ - bytesRead_;
    }

  private:
    Ftp::ISession* session_;
    std::uint64_t quota_;
    std::uint64_t bytesRead_;
};
