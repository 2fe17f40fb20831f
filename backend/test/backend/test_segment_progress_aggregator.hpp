#pragma once

#include <backend/segment_progress_aggregator.hpp>

#include <gtest/gtest.h>

#include <thread>
#include <vector>

namespace Test
{
    class SegmentProgressAggregatorTests : public ::testing::Test
    {};

    TEST_F(SegmentProgressAggregatorTests, SumsAllSegments)
    {
        SegmentProgressAggregator aggregator{1000, 4};

        aggregator.update({.segmentId = 0, .bytesReceived = 100, .quotaLength = 250, .speedBytesPerSecond = 10.0});
        const auto progress =
            aggregator.update({.segmentId = 2, .bytesReceived = 150, .quotaLength = 250, .speedBytesPerSecond = 15.0});

        EXPECT_EQ(progress.bytesTransferred, 250);
        EXPECT_EQ(progress.totalBytes, 1000);
        EXPECT_DOUBLE_EQ(progress.speedBytesPerSecond, 25.0);
        EXPECT_DOUBLE_EQ(progress.etaSeconds, 30.0);
    }

    TEST_F(SegmentProgressAggregatorTests, LaterUpdatesReplaceEarlierOnes)
    {
        SegmentProgressAggregator aggregator{1000, 2};

        aggregator.update({.segmentId = 1, .bytesReceived = 100, .quotaLength = 500, .speedBytesPerSecond = 50.0});
        aggregator.update({.segmentId = 1, .bytesReceived = 500, .quotaLength = 500, .speedBytesPerSecond = 0.0});

        const auto progress = aggregator.snapshot();
        EXPECT_EQ(progress.bytesTransferred, 500);
        EXPECT_DOUBLE_EQ(progress.etaSeconds, 0.0);
    }

    TEST_F(SegmentProgressAggregatorTests, UnknownSegmentsAreIgnored)
    {
        SegmentProgressAggregator aggregator{1000, 2};

        aggregator.update({.segmentId = 5, .bytesReceived = 100});
        aggregator.update({.segmentId = -1, .bytesReceived = 100});

        EXPECT_EQ(aggregator.snapshot().bytesTransferred, 0);
    }

    TEST_F(SegmentProgressAggregatorTests, ForwardsAggregatedSnapshots)
    {
        SegmentProgressAggregator aggregator{300, 3};
        std::vector<std::uint64_t> totals{};
        auto callback = aggregator.forwardTo([&](SharedData::TransferProgress const& progress) {
            totals.push_back(progress.bytesTransferred);
        });

        callback({.segmentId = 0, .bytesReceived = 100, .quotaLength = 100});
        callback({.segmentId = 1, .bytesReceived = 50, .quotaLength = 100});
        callback({.segmentId = 2, .bytesReceived = 100, .quotaLength = 100});

        EXPECT_EQ(totals, (std::vector<std::uint64_t>{100, 150, 250}));
    }

    TEST_F(SegmentProgressAggregatorTests, ConcurrentUpdatesEndInFinalTotal)
    {
        constexpr int segments = 8;
        constexpr std::uint64_t quota = 10'000;
        SegmentProgressAggregator aggregator{segments * quota, segments};

        std::vector<std::thread> threads{};
        for (int id = 0; id != segments; ++id)
        {
            threads.emplace_back([&aggregator, id]() {
                for (std::uint64_t received = 0; received <= quota; received += 100)
                    aggregator.update({.segmentId = id, .bytesReceived = received, .quotaLength = quota});
            });
        }
        for (auto& thread : threads)
            thread.join();

        EXPECT_EQ(aggregator.snapshot().bytesTransferred, segments * quota);
    }
}
