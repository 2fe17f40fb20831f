#pragma once

#include <shared_data/transfer_progress.hpp>

#include <functional>

// May be empty.
using ProgressCallback = std::function<void(SharedData::TransferProgress const&)>;

// Called concurrently by the segment workers of one download. May be empty.
using SegmentProgressCallback = std::function<void(SharedData::SegmentProgress const&)>;
