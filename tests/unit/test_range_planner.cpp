#include <gtest/gtest.h>
#include "lobbylink/transfer/range_planner.hpp"
#include <initializer_list>

using namespace lobbylink::transfer;

namespace {
constexpr std::uint64_t MiB = 1024 * 1024;
}

TEST(RangePlannerTest, ThreadCountTiers) {
    EXPECT_EQ(RangePlanner::select_thread_count(512 * 1024), 2u);
    EXPECT_EQ(RangePlanner::select_thread_count(MiB - 1), 2u);
    EXPECT_EQ(RangePlanner::select_thread_count(MiB), 4u);
    EXPECT_EQ(RangePlanner::select_thread_count(5 * MiB - 1), 4u);
    EXPECT_EQ(RangePlanner::select_thread_count(5 * MiB), 8u);
    EXPECT_EQ(RangePlanner::select_thread_count(12 * MiB), 8u);
    EXPECT_EQ(RangePlanner::select_thread_count(20 * MiB), 10u);
    EXPECT_EQ(RangePlanner::select_thread_count(100 * MiB - 1), 10u);
    EXPECT_EQ(RangePlanner::select_thread_count(100 * MiB), 12u);
    EXPECT_EQ(RangePlanner::select_thread_count(8ull * 1024 * MiB), MAX_TRANSFER_THREADS);
}

TEST(RangePlannerTest, TinyFilesNeverGetMoreThreadsThanBytes) {
    EXPECT_EQ(RangePlanner::select_thread_count(1), 1u);
    EXPECT_EQ(RangePlanner::select_thread_count(0), 1u);
    EXPECT_EQ(RangePlanner::select_thread_count(2), 2u);
}

TEST(RangePlannerTest, TwelveMegabytesSplitsIntoEightEqualRanges) {
    auto ranges = RangePlanner::plan(12582912);
    ASSERT_EQ(ranges.size(), 8u);
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        EXPECT_EQ(ranges[i].start, i * 1572864);
        EXPECT_EQ(ranges[i].size(), 1572864u);
    }
    EXPECT_EQ(ranges.back().end, 12582912u);
}

TEST(RangePlannerTest, RemainderGoesToLeadingRanges) {
    auto ranges = RangePlanner::partition(10, 4);
    ASSERT_EQ(ranges.size(), 4u);
    EXPECT_EQ(ranges[0], (ByteRange{0, 3}));
    EXPECT_EQ(ranges[1], (ByteRange{3, 6}));
    EXPECT_EQ(ranges[2], (ByteRange{6, 8}));
    EXPECT_EQ(ranges[3], (ByteRange{8, 10}));
}

TEST(RangePlannerTest, RangesAreContiguousAndCoverTheFile) {
    for (std::uint64_t size : std::initializer_list<std::uint64_t>{1, 7, 999999, 5 * MiB + 3, 150 * MiB + 11}) {
        auto ranges = RangePlanner::plan(size);
        std::uint64_t expected_start = 0;
        for (const auto& range : ranges) {
            EXPECT_EQ(range.start, expected_start);
            EXPECT_GT(range.size(), 0u);
            expected_start = range.end;
        }
        EXPECT_EQ(expected_start, size);
    }
}

TEST(RangePlannerTest, ChunkCount) {
    EXPECT_EQ(RangePlanner::chunk_count(ByteRange{0, 1572864}, 4 * MiB), 1u);
    EXPECT_EQ(RangePlanner::chunk_count(ByteRange{0, 1572864}, 262144), 6u);
    EXPECT_EQ(RangePlanner::chunk_count(ByteRange{100, 101}, 262144), 1u);
    EXPECT_EQ(RangePlanner::chunk_count(ByteRange{5, 5}, 262144), 0u);
    EXPECT_EQ(RangePlanner::chunk_count(ByteRange{0, 262145}, 262144), 2u);
}

TEST(RangePlannerTest, ThreadRequestIds) {
    EXPECT_EQ(RangePlanner::thread_request_id("transfer-42", 7), "transfer-42-thread7");

    auto parsed = RangePlanner::parse_thread_request_id("transfer-1700000000000-k3j9x0abc-thread11");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->first, "transfer-1700000000000-k3j9x0abc");
    EXPECT_EQ(parsed->second, 11u);

    EXPECT_FALSE(RangePlanner::parse_thread_request_id("transfer-42").has_value());
    EXPECT_FALSE(RangePlanner::parse_thread_request_id("transfer-42-thread").has_value());
    EXPECT_FALSE(RangePlanner::parse_thread_request_id("transfer-42-threadx").has_value());
    EXPECT_FALSE(RangePlanner::parse_thread_request_id("-thread3").has_value());
}
