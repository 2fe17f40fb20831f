#pragma once

#include <backend/connection_factory_interface.hpp>
#include <backend/progress_callbacks.hpp>
#include <backend/transfer_engine_options.hpp>
#include <ftp/server_endpoint.hpp>
#include <shared_data/file_operations/operation_error.hpp>

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Downloads a file as up to maxSegmentsLimit byte ranges, each over its own connection and into its own
 * temporary file, and concatenates the parts once all of them are complete.
 */
class SegmentedDownload
{
  public:
    using Error = SharedData::OperationError;
    using ErrorType = SharedData::OperationErrorType;

    struct Segment
    {
        int id{0};
        std::uint64_t startOffset{0};
        std::uint64_t length{0};
        std::filesystem::path tempFilePath{};
    };

    SegmentedDownload(IConnectionFactory& factory, TransferEngineOptions options);

    /**
     * @brief Splits totalSize into segmentCount ranges of ceil(totalSize / segmentCount) bytes, the last one
     * shortened to fit. Ranges that would start at or beyond totalSize are left out.
     *
     * @param segmentCount Clamped to [1, maxSegments] and maxSegments to [1, maxSegmentsLimit].
     */
    static std::vector<Segment> planSegments(
        std::uint64_t totalSize,
        int segmentCount,
        std::filesystem::path const& localPath,
        int maxSegments = maxSegmentsLimit);

    /**
     * @brief "<localPath>.part<index>"
     */
    static std::filesystem::path temporaryPartPath(std::filesystem::path const& localPath, int index);

    /**
     * @brief Runs all segments concurrently and merges them into localPath.
     *
     * @return PartialFailure naming the failed segments if any segment used up its retries. Parts are then left
     * on disk and no destination file is written.
     */
    std::expected<void, Error> download(
        Ftp::ServerEndpoint const& endpoint,
        std::string const& remotePath,
        std::filesystem::path const& localPath,
        std::uint64_t totalSize,
        int segmentCount,
        SegmentProgressCallback const& onSegmentProgress);

  private:
    std::expected<void, Error> runSegment(
        Ftp::ServerEndpoint const& endpoint,
        std::string const& remotePath,
        Segment const& segment,
        SegmentProgressCallback const& onSegmentProgress) const;

    std::expected<void, Error> merge(std::vector<Segment> const& segments, std::filesystem::path const& localPath) const;

  private:
    IConnectionFactory* factory_;
    TransferEngineOptions options_;
};
