#include <backend/download_engine.hpp>
#include <backend/segment_progress_aggregator.hpp>
#include <backend/segmented_download.hpp>
#include <backend/single_stream_download.hpp>
#include <log/log.hpp>
#include <utility/format_bytes.hpp>

DownloadEngine::DownloadEngine(IConnectionFactory& factory, TransferEngineOptions options)
    : factory_{&factory}
    , options_{std::move(options)}
    , lister_{options_.listRetryPolicy()}
{}

DownloadEngine::Strategy
DownloadEngine::chooseStrategy(int segmentCount, std::optional<std::uint64_t> remoteSize) const
{
    if (segmentCount > 1 && remoteSize && *remoteSize > options_.segmentedThreshold)
        return Strategy::Segmented;
    return Strategy::SingleStream;
}

std::expected<void, DownloadEngine::Error> DownloadEngine::download(
    Ftp::ServerEndpoint const& endpoint,
    TransferRequest const& request,
    TransferCallbacks const& callbacks)
{
    if (request.remotePath.empty() || request.localPath.empty())
    {
        Log::error("DownloadEngine: Invalid path.");
        return std::unexpected(Error{.type = ErrorType::InvalidPath});
    }

    auto session = factory_->connect(endpoint);
    if (!session)
    {
        Log::error("DownloadEngine: Cannot connect to {}: {}", endpoint.host, session.error().toString());
        return std::unexpected(std::move(session).error());
    }

    auto remoteSize = request.expectedSize;
    if (!remoteSize)
    {
        if (auto size = (*session)->size(request.remotePath); size)
            remoteSize = *size;
        else
            Log::info("DownloadEngine: Size of '{}' is unknown: {}", request.remotePath, size.error().message);
    }

    const auto strategy = chooseStrategy(request.segmentCount, remoteSize);
    if (strategy == Strategy::SingleStream)
    {
        Log::info(
            "DownloadEngine: Single stream download of '{}' ({}).",
            request.remotePath,
            Utility::formatBytes(remoteSize));
        SingleStreamDownload singleStream{*factory_, endpoint, options_};
        return singleStream.download(**session, request.remotePath, request.localPath, callbacks.onProgress, remoteSize);
    }

    Log::info(
        "DownloadEngine: Segmented download of '{}' ({}) with {} segments.",
        request.remotePath,
        Utility::formatBytes(remoteSize),
        request.segmentCount);

    // Segments dial their own connections.
    (*session)->close();
    session->reset();

    SegmentProgressAggregator aggregator{*remoteSize, maxSegmentsLimit};
    SegmentProgressCallback onSegmentProgress{};
    if (callbacks.onProgress || callbacks.onSegmentProgress)
    {
        onSegmentProgress = [&callbacks, forward = aggregator.forwardTo(callbacks.onProgress)](
                                SharedData::SegmentProgress const& progress) {
            if (callbacks.onSegmentProgress)
                callbacks.onSegmentProgress(progress);
            forward(progress);
        };
    }

    SegmentedDownload segmented{*factory_, options_};
    return segmented.download(
        endpoint, request.remotePath, request.localPath, *remoteSize, request.segmentCount, onSegmentProgress);
}

std::expected<std::vector<SharedData::DirectoryEntry>, DownloadEngine::Error>
DownloadEngine::list(Ftp::ServerEndpoint const& endpoint, std::string const& path)
{
    auto session = factory_->connect(endpoint);
    if (!session)
        return std::unexpected(std::move(session).error());

    Log::debug("DownloadEngine: Listing '{}'.", path);
    return lister_.list(**session, path);
}

std::expected<std::string, DownloadEngine::Error> DownloadEngine::currentDirectory(Ftp::ServerEndpoint const& endpoint)
{
    auto session = factory_->connect(endpoint);
    if (!session)
        return std::unexpected(std::move(session).error());

    return lister_.currentDirectory(**session);
}
