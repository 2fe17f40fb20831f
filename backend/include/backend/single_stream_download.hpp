#pragma once

#include <backend/connection_factory_interface.hpp>
#include <backend/progress_callbacks.hpp>
#include <backend/transfer_engine_options.hpp>
#include <ftp/server_endpoint.hpp>
#include <ftp/session_interface.hpp>
#include <shared_data/file_operations/operation_error.hpp>

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

/**
 * @brief Resumable whole-file download over a single connection.
 *
 * Appends to whatever the local file already holds. Every retry reconnects through the factory and resumes from
 * the size the local file has at that moment.
 */
class SingleStreamDownload
{
  public:
    using Error = SharedData::OperationError;
    using ErrorType = SharedData::OperationErrorType;

    SingleStreamDownload(IConnectionFactory& factory, Ftp::ServerEndpoint endpoint, TransferEngineOptions options);

    /**
     * @brief Downloads remotePath to localPath.
     *
     * @param session Used for the first attempt. Retries use fresh connections.
     * @param remotePath The remote file.
     * @param localPath The local file, its parent directory is created if missing.
     * @param onProgress Receives a snapshot for every written chunk.
     * @param knownRemoteSize Skips the SIZE query if given.
     */
    std::expected<void, Error> download(
        Ftp::ISession& session,
        std::string const& remotePath,
        std::filesystem::path const& localPath,
        ProgressCallback const& onProgress,
        std::optional<std::uint64_t> knownRemoteSize = std::nullopt);

  private:
    std::expected<void, Error> attempt(
        Ftp::ISession& session,
        std::string const& remotePath,
        std::filesystem::path const& localPath,
        ProgressCallback const& onProgress,
        std::optional<std::uint64_t> remoteSize);

  private:
    IConnectionFactory* factory_;
    Ftp::ServerEndpoint endpoint_;
    TransferEngineOptions options_;
};
