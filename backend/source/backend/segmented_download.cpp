#include <backend/segmented_download.hpp>
#include <backend/bounded_reader.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <future>
#include <optional>

namespace
{
    std::uint64_t fileSizeOrZero(std::filesystem::path const& path)
    {
        std::error_code ec{};
        const auto size = std::filesystem::file_size(path, ec);
        return ec ? 0 : static_cast<std::uint64_t>(size);
    }
}

SegmentedDownload::SegmentedDownload(IConnectionFactory& factory, TransferEngineOptions options)
    : factory_{&factory}
    , options_{std::move(options)}
{}

std::filesystem::path SegmentedDownload::temporaryPartPath(std::filesystem::path const& localPath, int index)
{
    return std::filesystem::path{localPath.generic_string() + ".part" + std::to_string(index)};
}

std::vector<SegmentedDownload::Segment> SegmentedDownload::planSegments(
    std::uint64_t totalSize,
    int segmentCount,
    std::filesystem::path const& localPath,
    int maxSegments)
{
    const auto upperBound = std::clamp(maxSegments, 1, maxSegmentsLimit);
    const auto count = static_cast<std::uint64_t>(std::clamp(segmentCount, 1, upperBound));

    std::vector<Segment> segments{};
    if (totalSize == 0)
        return segments;

    const auto segmentLength = (totalSize + count - 1) / count;
    for (std::uint64_t i = 0; i != count; ++i)
    {
        const auto start = i * segmentLength;
        if (start >= totalSize)
            continue;

        segments.push_back(Segment{
            .id = static_cast<int>(i),
            .startOffset = start,
            .length = std::min(segmentLength, totalSize - start),
            .tempFilePath = temporaryPartPath(localPath, static_cast<int>(i)),
        });
    }
    return segments;
}

std::expected<void, SegmentedDownload::Error> SegmentedDownload::download(
    Ftp::ServerEndpoint const& endpoint,
    std::string const& remotePath,
    std::filesystem::path const& localPath,
    std::uint64_t totalSize,
    int segmentCount,
    SegmentProgressCallback const& onSegmentProgress)
{
    if (localPath.empty() || remotePath.empty())
    {
        Log::error("SegmentedDownload: Invalid path.");
        return std::unexpected(Error{.type = ErrorType::InvalidPath});
    }

    if (localPath.has_parent_path())
    {
        std::error_code ec{};
        std::filesystem::create_directories(localPath.parent_path(), ec);
        if (ec)
        {
            Log::error(
                "SegmentedDownload: Cannot create directory '{}': {}",
                localPath.parent_path().generic_string(),
                ec.message());
            return std::unexpected(Error{.type = ErrorType::OpenFailure, .extraInfo = ec.message()});
        }
    }

    const auto segments = planSegments(totalSize, segmentCount, localPath, options_.maxSegments);
    if (segments.empty())
    {
        Log::info("SegmentedDownload: '{}' is empty, creating empty file.", remotePath);
        std::ofstream empty{localPath, std::ios::binary | std::ios::trunc};
        if (!empty.is_open())
            return std::unexpected(Error{.type = ErrorType::OpenFailure});
        return {};
    }

    Log::info(
        "SegmentedDownload: Downloading '{}' ({} bytes) to '{}' in {} segments.",
        remotePath,
        totalSize,
        localPath.generic_string(),
        segments.size());

    std::vector<std::future<std::expected<void, Error>>> workers{};
    workers.reserve(segments.size());
    for (auto const& segment : segments)
    {
        workers.push_back(std::async(std::launch::async, [this, &endpoint, &remotePath, &segment, &onSegmentProgress]() {
            return runSegment(endpoint, remotePath, segment, onSegmentProgress);
        }));
    }

    // Every worker settles before anything is decided.
    std::vector<std::expected<void, Error>> results{};
    results.reserve(workers.size());
    for (auto& worker : workers)
        results.push_back(worker.get());

    std::vector<int> failedSegments{};
    std::optional<Error> firstError{};
    int maxAttempts = 0;
    for (std::size_t i = 0; i != results.size(); ++i)
    {
        if (results[i])
            continue;

        failedSegments.push_back(segments[i].id);
        maxAttempts = std::max(maxAttempts, results[i].error().attempts);
        if (!firstError)
            firstError = results[i].error();
    }

    if (firstError)
    {
        const bool canceled = options_.stopRequested() || firstError->type == ErrorType::Canceled;
        Error error{
            .type = canceled ? ErrorType::Canceled : ErrorType::PartialFailure,
            .ftpError = firstError->ftpError,
            .extraInfo = firstError->toString(),
            .attempts = maxAttempts,
            .failedSegments = std::move(failedSegments),
        };
        Log::error("SegmentedDownload: Download of '{}' failed: {}", remotePath, error.toString());
        return std::unexpected(std::move(error));
    }

    return merge(segments, localPath);
}

std::expected<void, SegmentedDownload::Error> SegmentedDownload::runSegment(
    Ftp::ServerEndpoint const& endpoint,
    std::string const& remotePath,
    Segment const& segment,
    SegmentProgressCallback const& onSegmentProgress) const
{
    const auto label = fmt::format("SegmentedDownload[{}]", segment.id);
    // Reported counts never go backwards, even when a retry starts the segment over.
    std::uint64_t highWaterMark = 0;

    auto result = options_.downloadRetryPolicy().run(label, [&](int attempt) -> std::expected<void, Error> {
        if (options_.stopRequested())
            return std::unexpected(Error{.type = ErrorType::Canceled});

        auto session = factory_->connect(endpoint);
        if (!session)
            return std::unexpected(std::move(session).error());

        // A failed attempt leaves an unknown prefix behind, so every attempt starts the part from scratch.
        std::ofstream part{segment.tempFilePath, std::ios::binary | std::ios::trunc};
        if (!part.is_open())
        {
            Log::error("{}: Failed to open file: {}", label, segment.tempFilePath.generic_string());
            return std::unexpected(Error{.type = ErrorType::OpenFailure});
        }

        Log::debug(
            "{}: Attempt {} for bytes [{}, {}).",
            label,
            attempt,
            segment.startOffset,
            segment.startOffset + segment.length);

        const auto start = std::chrono::steady_clock::now();
        std::uint64_t received = 0;
        bool writeFailed = false;
        bool canceled = false;

        BoundedReader reader{**session, segment.length};
        auto readResult = reader.read(remotePath, segment.startOffset, [&](std::string_view data) {
            part.write(data.data(), static_cast<std::streamsize>(data.size()));
            if (!part.good())
            {
                writeFailed = true;
                return false;
            }
            received += data.size();
            highWaterMark = std::max(highWaterMark, received);

            if (onSegmentProgress)
            {
                const auto elapsed = std::max(
                    1e-6, std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count());
                onSegmentProgress(SharedData::SegmentProgress{
                    .segmentId = segment.id,
                    .bytesReceived = highWaterMark,
                    .quotaLength = segment.length,
                    .speedBytesPerSecond = static_cast<double>(received) / elapsed,
                });
            }

            if (options_.stopRequested())
            {
                canceled = true;
                return false;
            }
            return true;
        });

        part.close();

        if (writeFailed || (part.fail() && !canceled))
            return std::unexpected(Error{.type = ErrorType::TargetFileNotGood});
        if (canceled)
            return std::unexpected(Error{.type = ErrorType::Canceled});
        if (!readResult)
        {
            return std::unexpected(Error{
                .type = ErrorType::TransferError,
                .ftpError = readResult.error(),
                .extraInfo = fmt::format("Received {} of {} bytes", received, segment.length),
            });
        }
        if (readResult->outcome != BoundedReader::Outcome::QuotaReached)
        {
            return std::unexpected(Error{
                .type = ErrorType::ShortTransfer,
                .extraInfo = fmt::format("Server ended transfer at {} of {} bytes", received, segment.length),
            });
        }
        return {};
    });

    if (!result)
    {
        auto error = std::move(result).error();
        if (error.type == ErrorType::ShortTransfer)
            error.type = ErrorType::TransferError;
        error.failedSegments = {segment.id};
        return std::unexpected(std::move(error));
    }

    Log::debug("{}: Complete.", label);
    return {};
}

std::expected<void, SegmentedDownload::Error>
SegmentedDownload::merge(std::vector<Segment> const& segments, std::filesystem::path const& localPath) const
{
    for (auto const& segment : segments)
    {
        const auto partSize = fileSizeOrZero(segment.tempFilePath);
        if (partSize != segment.length)
        {
            Log::error(
                "SegmentedDownload: Part '{}' has {} bytes, expected {}.",
                segment.tempFilePath.generic_string(),
                partSize,
                segment.length);
            return std::unexpected(Error{
                .type = ErrorType::MergeFailure,
                .extraInfo = fmt::format("Part {} is incomplete", segment.id),
                .failedSegments = {segment.id},
            });
        }
    }

    {
        std::ofstream out{localPath, std::ios::binary | std::ios::trunc};
        if (!out.is_open())
        {
            Log::error("SegmentedDownload: Failed to open file: {}", localPath.generic_string());
            return std::unexpected(Error{.type = ErrorType::OpenFailure});
        }

        for (auto const& segment : segments)
        {
            std::ifstream in{segment.tempFilePath, std::ios::binary};
            if (!in.is_open())
            {
                out.close();
                std::error_code ec{};
                std::filesystem::remove(localPath, ec);
                return std::unexpected(Error{
                    .type = ErrorType::MergeFailure,
                    .extraInfo = fmt::format("Cannot read part {}", segment.id),
                    .failedSegments = {segment.id},
                });
            }
            out << in.rdbuf();
            if (!out.good())
            {
                out.close();
                std::error_code ec{};
                std::filesystem::remove(localPath, ec);
                Log::error("SegmentedDownload: Writing '{}' failed.", localPath.generic_string());
                return std::unexpected(Error{.type = ErrorType::TargetFileNotGood});
            }
        }
    }

    for (auto const& segment : segments)
    {
        std::error_code ec{};
        std::filesystem::remove(segment.tempFilePath, ec);
        if (ec)
            Log::warn("SegmentedDownload: Cannot remove '{}': {}", segment.tempFilePath.generic_string(), ec.message());
    }

    Log::info("SegmentedDownload: Merged {} parts into '{}'.", segments.size(), localPath.generic_string());
    return {};
}
