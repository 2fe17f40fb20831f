#pragma once

#include <cstdint>

namespace SharedData
{
    /**
     * @brief Snapshot of a whole-file transfer. Passed to progress callbacks, never stored.
     */
    struct TransferProgress
    {
        std::uint64_t bytesTransferred{0};
        // 0 if the remote size is unknown
        std::uint64_t totalBytes{0};
        double speedBytesPerSecond{0.0};
        double etaSeconds{0.0};
    };

    /**
     * @brief Snapshot of one segment worker of a segmented download.
     */
    struct SegmentProgress
    {
        int segmentId{0};
        std::uint64_t bytesReceived{0};
        std::uint64_t quotaLength{0};
        double speedBytesPerSecond{0.0};
    };
}
