#pragma once

#include <backend/retry_policy.hpp>
#include <ftp/session_interface.hpp>
#include <shared_data/directory_entry.hpp>
#include <shared_data/file_operations/operation_error.hpp>

#include <expected>
#include <string>
#include <vector>

class DirectoryLister
{
  public:
    using Error = SharedData::OperationError;
    using ErrorType = SharedData::OperationErrorType;

    explicit DirectoryLister(RetryPolicy retryPolicy);

    /**
     * @brief Lists a remote directory. Prefers MLSD, falls back to NLST and classifies every name by trying to
     * enter it.
     *
     * @param session An open session. Its working directory is changed to path.
     * @param path The directory to list. A relative path is resolved against the working directory once, before
     * the first attempt.
     * @return Directories first, then files, both by case-insensitive name. A ProtocolError once retries are used
     * up.
     */
    std::expected<std::vector<SharedData::DirectoryEntry>, Error>
    list(Ftp::ISession& session, std::string const& path) const;

    /**
     * @brief The working directory of the server, "/" if it cannot be determined.
     */
    std::string currentDirectory(Ftp::ISession& session) const;

  private:
    std::expected<std::vector<SharedData::DirectoryEntry>, Error>
    listOnce(Ftp::ISession& session, std::string const& path) const;
    std::expected<std::vector<SharedData::DirectoryEntry>, Error> listStructured(Ftp::ISession& session) const;
    std::expected<std::vector<SharedData::DirectoryEntry>, Error> listByNames(Ftp::ISession& session) const;

  private:
    RetryPolicy retryPolicy_;
};
