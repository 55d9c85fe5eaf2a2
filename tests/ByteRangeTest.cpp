#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>

#include "core/ByteRange.hpp"

namespace {

void ExpectRanges(const std::vector<ByteRange>& actual,
                  const std::vector<std::pair<uint64_t, uint64_t>>& expected) {
    ASSERT_EQ(actual.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(actual[i].start, expected[i].first) << "range " << i;
        EXPECT_EQ(actual[i].end, expected[i].second) << "range " << i;
    }
}

}

TEST(PartitionRangesTest, SingleWorkerOwnsEverything) {
    ExpectRanges(PartitionRanges(10, 1), { { 0, 9 } });
}

TEST(PartitionRangesTest, EvenSplit) {
    ExpectRanges(PartitionRanges(10, 2), { { 0, 4 }, { 5, 9 } });
}

TEST(PartitionRangesTest, LastRangeIsShorter) {
    ExpectRanges(PartitionRanges(10, 3), { { 0, 3 }, { 4, 7 }, { 8, 9 } });
    ExpectRanges(PartitionRanges(10, 4), { { 0, 2 }, { 3, 5 }, { 6, 8 }, { 9, 9 } });
}

TEST(PartitionRangesTest, WorkersPastTheEndAreNotCreated) {
    ExpectRanges(PartitionRanges(5, 4), { { 0, 1 }, { 2, 3 }, { 4, 4 } });
    ExpectRanges(PartitionRanges(3, 5), { { 0, 0 }, { 1, 1 }, { 2, 2 } });
}

TEST(PartitionRangesTest, HugeWorkerCountYieldsOneBytePerRange) {
    ExpectRanges(PartitionRanges(3, std::numeric_limits<size_t>::max()),
                 { { 0, 0 }, { 1, 1 }, { 2, 2 } });
    ExpectRanges(PartitionRanges(std::numeric_limits<uint64_t>::max(), 2),
                 { { 0, 9223372036854775807ull }, { 9223372036854775808ull, 18446744073709551614ull } });
}

TEST(PartitionRangesTest, RangesCoverResourceExactly) {
    const uint64_t total = 1000003;
    auto ranges = PartitionRanges(total, 7);

    uint64_t next = 0;
    for (const auto& range : ranges) {
        EXPECT_EQ(range.start, next);
        next = range.end + 1;
    }
    EXPECT_EQ(next, total);
}

TEST(PartitionRangesTest, EmptyResource) {
    EXPECT_TRUE(PartitionRanges(0, 4).empty());
}

TEST(PartitionRangesTest, ZeroWorkersRejected) {
    EXPECT_THROW(PartitionRanges(10, 0), std::invalid_argument);
}
