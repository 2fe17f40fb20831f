#include <backend/bounded_reader.hpp>
#include <log/log.hpp>

#include <algorithm>

BoundedReader::BoundedReader(Ftp::ISession& session, std::uint64_t quota)
    : session_{&session}
    , quota_{quota}
    , bytesRead_{0}
{}

std::expected<BoundedReader::Result, Ftp::FtpError> BoundedReader::read(
    std::string const& remotePath,
    std::uint64_t offset,
    std::function<bool(std::string_view data)> const& onData)
{
    if (remaining() == 0)
    {
        session_->close();
        return Result{.bytesRead = bytesRead_, .outcome = Outcome::QuotaReached};
    }

    bool consumerStopped = false;
    auto retrieved = session_->retrieve(remotePath, offset, [&](std::string_view data) {
        const auto take = static_cast<std::size_t>(std::min<std::uint64_t>(data.size(), remaining()));
        if (take > 0)
        {
            if (!onData(data.substr(0, take)))
            {
                consumerStopped = true;
                return false;
            }
            bytesRead_ += take;
        }
        // Stop the server from sending more than needed.
        return remaining() > 0;
    });

    if (remaining() == 0)
    {
        // Whatever the data connection reports after the deliberate stop is irrelevant.
        Log::trace("BoundedReader: Quota of {} bytes reached for '{}', dropping connection.", quota_, remotePath);
        session_->close();
        return Result{.bytesRead = bytesRead_, .outcome = Outcome::QuotaReached};
    }

    if (consumerStopped)
    {
        session_->close();
        return Result{.bytesRead = bytesRead_, .outcome = Outcome::StoppedByConsumer};
    }

    if (!retrieved)
        return std::unexpected(retrieved.error());

    return Result{.bytesRead = bytesRead_, .outcome = Outcome::EndOfStream};
}
