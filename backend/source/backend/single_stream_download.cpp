#include <backend/single_stream_download.hpp>
#include <log/log.hpp>
#include <utility/format_bytes.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <memory>

namespace
{
    std::uint64_t localFileSize(std::filesystem::path const& path)
    {
        std::error_code ec{};
        const auto size = std::filesystem::file_size(path, ec);
        if (ec)
            return 0;
        return static_cast<std::uint64_t>(size);
    }
}

SingleStreamDownload::SingleStreamDownload(
    IConnectionFactory& factory,
    Ftp::ServerEndpoint endpoint,
    TransferEngineOptions options)
    : factory_{&factory}
    , endpoint_{std::move(endpoint)}
    , options_{std::move(options)}
{}

std::expected<void, SingleStreamDownload::Error> SingleStreamDownload::download(
    Ftp::ISession& session,
    std::string const& remotePath,
    std::filesystem::path const& localPath,
    ProgressCallback const& onProgress,
    std::optional<std::uint64_t> knownRemoteSize)
{
    if (localPath.empty() || remotePath.empty())
    {
        Log::error("SingleStreamDownload: Invalid path.");
        return std::unexpected(Error{.type = ErrorType::InvalidPath});
    }

    if (localPath.has_parent_path())
    {
        std::error_code ec{};
        std::filesystem::create_directories(localPath.parent_path(), ec);
        if (ec)
        {
            Log::error(
                "SingleStreamDownload: Cannot create directory '{}': {}",
                localPath.parent_path().generic_string(),
                ec.message());
            return std::unexpected(Error{.type = ErrorType::OpenFailure, .extraInfo = ec.message()});
        }
    }

    auto remoteSize = knownRemoteSize;
    if (!remoteSize)
    {
        if (auto size = session.size(remotePath); size)
            remoteSize = *size;
        else
            Log::info("SingleStreamDownload: Size of '{}' is unknown: {}", remotePath, size.error().message);
    }

    const auto localSize = localFileSize(localPath);
    if (remoteSize && localSize >= *remoteSize)
    {
        Log::info("SingleStreamDownload: '{}' is already complete.", localPath.generic_string());
        if (onProgress)
        {
            onProgress(SharedData::TransferProgress{
                .bytesTransferred = *remoteSize,
                .totalBytes = *remoteSize,
            });
        }
        return {};
    }

    Log::info(
        "SingleStreamDownload: Downloading '{}' to '{}', {} of {} present.",
        remotePath,
        localPath.generic_string(),
        Utility::formatBytes(std::optional<std::uint64_t>{localSize}),
        Utility::formatBytes(remoteSize));

    auto result = options_.downloadRetryPolicy().run("SingleStreamDownload", [&](int attemptNumber) {
        if (attemptNumber == 1)
            return attempt(session, remotePath, localPath, onProgress, remoteSize);

        // Never trust a connection that just failed.
        session.close();
        auto fresh = factory_->connect(endpoint_);
        if (!fresh)
            return std::expected<void, Error>{std::unexpected(std::move(fresh).error())};
        return attempt(**fresh, remotePath, localPath, onProgress, remoteSize);
    });

    if (!result)
    {
        auto error = std::move(result).error();
        // A reconnect that failed on the last attempt still ends the download as a transfer failure.
        switch (error.type)
        {
            case ErrorType::ShortTransfer:
            case ErrorType::ConnectionError:
            case ErrorType::ProtocolError:
                error.type = ErrorType::TransferError;
                break;
            default:
                break;
        }
        Log::error("SingleStreamDownload: Download of '{}' failed: {}", remotePath, error.toString());
        return std::unexpected(std::move(error));
    }

    Log::info("SingleStreamDownload: Finished '{}'.", localPath.generic_string());
    return {};
}

std::expected<void, SingleStreamDownload::Error> SingleStreamDownload::attempt(
    Ftp::ISession& session,
    std::string const& remotePath,
    std::filesystem::path const& localPath,
    ProgressCallback const& onProgress,
    std::optional<std::uint64_t> remoteSize)
{
    if (options_.stopRequested())
        return std::unexpected(Error{.type = ErrorType::Canceled});

    // The file on disk is the only truth about what is already there.
    const auto offset = localFileSize(localPath);
    if (remoteSize && offset >= *remoteSize)
        return {};

    std::ofstream localFile{localPath, std::ios::binary | std::ios::app};
    if (!localFile.is_open())
    {
        Log::error("SingleStreamDownload: Failed to open file: {}", localPath.generic_string());
        return std::unexpected(Error{.type = ErrorType::OpenFailure});
    }

    const auto start = std::chrono::steady_clock::now();
    std::uint64_t received = 0;
    bool writeFailed = false;
    bool canceled = false;

    auto retrieved = session.retrieve(remotePath, offset, [&](std::string_view data) {
        localFile.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!localFile.good())
        {
            writeFailed = true;
            return false;
        }
        received += data.size();

        if (onProgress)
        {
            const auto elapsed = std::max(
                1e-6, std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count());
            const auto transferred = offset + received;
            const auto speed = static_cast<double>(received) / elapsed;
            const auto eta = (remoteSize && *remoteSize > transferred && speed > 0.0)
                ? static_cast<double>(*remoteSize - transferred) / speed
                : 0.0;
            onProgress(SharedData::TransferProgress{
                .bytesTransferred = transferred,
                .totalBytes = remoteSize.value_or(0),
                .speedBytesPerSecond = speed,
                .etaSeconds = eta,
            });
        }

        if (options_.stopRequested())
        {
            canceled = true;
            return false;
        }
        return true;
    });

    localFile.close();

    if (writeFailed)
    {
        Log::error("SingleStreamDownload: Writing to '{}' failed.", localPath.generic_string());
        return std::unexpected(Error{.type = ErrorType::TargetFileNotGood});
    }
    if (canceled)
    {
        Log::info("SingleStreamDownload: Download of '{}' canceled.", remotePath);
        return std::unexpected(Error{.type = ErrorType::Canceled});
    }
    if (!retrieved)
    {
        return std::unexpected(Error{
            .type = ErrorType::TransferError,
            .ftpError = retrieved.error(),
            .extraInfo = fmt::format("Received {} bytes from offset {}", received, offset),
        });
    }
    if (remoteSize && offset + received < *remoteSize)
    {
        return std::unexpected(Error{
            .type = ErrorType::ShortTransfer,
            .extraInfo = fmt::format("Server ended transfer at {} of {} bytes", offset + received, *remoteSize),
        });
    }
    return {};
}
