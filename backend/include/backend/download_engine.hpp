#pragma once

#include <backend/connection_factory_interface.hpp>
#include <backend/directory_lister.hpp>
#include <backend/progress_callbacks.hpp>
#include <backend/transfer_engine_options.hpp>
#include <ftp/server_endpoint.hpp>
#include <shared_data/directory_entry.hpp>
#include <shared_data/file_operations/operation_error.hpp>

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct TransferRequest
{
    std::string remotePath{};
    std::filesystem::path localPath{};
    // Skips the SIZE query when set.
    std::optional<std::uint64_t> expectedSize{std::nullopt};
    int segmentCount{1};
};

struct TransferCallbacks
{
    ProgressCallback onProgress{};
    // Segmented downloads only. onProgress also receives the aggregated progress of all segments.
    SegmentProgressCallback onSegmentProgress{};
};

/**
 * @brief Entry point for downloads and listings against one server.
 */
class DownloadEngine
{
  public:
    using Error = SharedData::OperationError;
    using ErrorType = SharedData::OperationErrorType;

    enum class Strategy
    {
        SingleStream,
        Segmented
    };

    DownloadEngine(IConnectionFactory& factory, TransferEngineOptions options);

    /**
     * @brief Segmented when more than one segment is requested and the size is known and above the threshold.
     */
    Strategy chooseStrategy(int segmentCount, std::optional<std::uint64_t> remoteSize) const;

    std::expected<void, Error>
    download(Ftp::ServerEndpoint const& endpoint, TransferRequest const& request, TransferCallbacks const& callbacks);

    std::expected<std::vector<SharedData::DirectoryEntry>, Error>
    list(Ftp::ServerEndpoint const& endpoint, std::string const& path);

    std::expected<std::string, Error> currentDirectory(Ftp::ServerEndpoint const& endpoint);

    TransferEngineOptions const& options() const
    {
        return options_;
    }

  private:
    IConnectionFactory* factory_;
    TransferEngineOptions options_;
    DirectoryLister lister_;
};
