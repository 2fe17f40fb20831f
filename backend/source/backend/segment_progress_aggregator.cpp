#include <backend/segment_progress_aggregator.hpp>

#include <algorithm>

SegmentProgressAggregator::SegmentProgressAggregator(std::uint64_t totalSize, int segmentCount)
    : totalSize_{totalSize}
    , received_(static_cast<std::size_t>(std::max(0, segmentCount)))
    , speeds_(static_cast<std::size_t>(std::max(0, segmentCount)))
{}

SharedData::TransferProgress SegmentProgressAggregator::update(SharedData::SegmentProgress const& progress)
{
    if (progress.segmentId >= 0 && static_cast<std::size_t>(progress.segmentId) < received_.size())
    {
        const auto index = static_cast<std::size_t>(progress.segmentId);
        received_[index].store(progress.bytesReceived, std::memory_order_relaxed);
        speeds_[index].store(progress.speedBytesPerSecond, std::memory_order_relaxed);
    }
    return snapshot();
}

SharedData::TransferProgress SegmentProgressAggregator::snapshot() const
{
    std::uint64_t received = 0;
    for (auto const& counter : received_)
        received += counter.load(std::memory_order_relaxed);

    double speed = 0.0;
    for (auto const& segmentSpeed : speeds_)
        speed += segmentSpeed.load(std::memory_order_relaxed);

    const auto eta =
        (speed > 0.0 && totalSize_ > received) ? static_cast<double>(totalSize_ - received) / speed : 0.0;

    return SharedData::TransferProgress{
        .bytesTransferred = received,
        .totalBytes = totalSize_,
        .speedBytesPerSecond = speed,
        .etaSeconds = eta,
    };
}

SegmentProgressCallback SegmentProgressAggregator::forwardTo(ProgressCallback onProgress)
{
    return [this, onProgress = std::move(onProgress)](SharedData::SegmentProgress const& progress) {
        const auto aggregated = update(progress);
        if (onProgress)
            onProgress(aggregated);
    };
}
