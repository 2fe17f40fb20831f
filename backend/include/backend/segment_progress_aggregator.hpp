#pragma once

#include <backend/progress_callbacks.hpp>
#include <shared_data/transfer_progress.hpp>

#include <atomic>
#include <cstdint>
#include <vector>

/**
 * @brief Turns per-segment progress into progress of the whole file. update() may be called concurrently.
 */
class SegmentProgressAggregator
{
  public:
    SegmentProgressAggregator(std::uint64_t totalSize, int segmentCount);

    /**
     * @brief Records a segment update and returns the resulting whole-file snapshot. Updates for unknown segment
     * ids are ignored.
     */
    SharedData::TransferProgress update(SharedData::SegmentProgress const& progress);

    SharedData::TransferProgress snapshot() const;

    /**
     * @brief A segment callback that forwards every aggregated snapshot to onProgress.
     *
     * The aggregator must outlive the returned callback.
     */
    SegmentProgressCallback forwardTo(ProgressCallback onProgress);

  private:
    std::uint64_t totalSize_;
    std::vector<std::atomic<std::uint64_t>> received_;
    std::vector<std::atomic<double>> speeds_;
};
