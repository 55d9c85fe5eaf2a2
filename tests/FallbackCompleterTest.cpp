#include <gtest/gtest.h>

#include "FakeRangeFetcher.hpp"
#include "core/ChunkStorage.hpp"
#include "core/FallbackCompleter.hpp"
#include "core/RangeWorker.hpp"
#include "utils/ActivityLog.hpp"
#include "utils/Errors.hpp"
#include "utils/byte_tools.hpp"

namespace {

const std::string kResource = "0123456789";

std::string HexSha256(const std::string& data) {
    return utils::HexEncode(utils::CalculateSHA256(data));
}

using Calls = std::vector<std::pair<uint64_t, uint64_t>>;

}

class FallbackCompleterTest : public ::testing::Test {
protected:
    ActivityLog log{200, false};
};

TEST_F(FallbackCompleterTest, NothingToDoWhenAlreadyComplete) {
    FakeRangeFetcher fetcher(kResource);
    ChunkStorage storage(10);
    storage.Insert(0, kResource);

    FallbackCompleter completer(fetcher, storage, log);
    EXPECT_TRUE(completer.Run());
    EXPECT_EQ(completer.FetchesIssued(), 0u);
    EXPECT_TRUE(fetcher.Calls().empty());
}

TEST_F(FallbackCompleterTest, FetchesFromWatermarkToEnd) {
    FakeRangeFetcher fetcher(kResource);
    ChunkStorage storage(10);
    storage.Insert(0, "0123");
    storage.Insert(7, "789");

    FallbackCompleter completer(fetcher, storage, log);
    EXPECT_TRUE(completer.Run());

    EXPECT_EQ(fetcher.Calls(), (Calls{ { 4, 9 } }));
    EXPECT_EQ(completer.FetchesIssued(), 1u);
    EXPECT_EQ(storage.BytesHashed(), 10u);
    EXPECT_EQ(storage.PendingChunksCount(), 0u);
    EXPECT_EQ(utils::HexEncode(storage.Finalize()), HexSha256(kResource));
}

TEST_F(FallbackCompleterTest, RepeatsUntilShortResponsesCloseTheGap) {
    FakeRangeFetcher fetcher(kResource);
    fetcher.SetMaxBytesPerResponse(4);
    ChunkStorage storage(10);

    FallbackCompleter completer(fetcher, storage, log);
    EXPECT_TRUE(completer.Run());

    EXPECT_EQ(fetcher.Calls(), (Calls{ { 0, 9 }, { 4, 9 }, { 8, 9 } }));
    EXPECT_EQ(utils::HexEncode(storage.Finalize()), HexSha256(kResource));
}

TEST_F(FallbackCompleterTest, FailuresBecomePlaceholders) {
    FakeRangeFetcher fetcher("abc");
    fetcher.FailAt(0);
    fetcher.EmptyAt(1);
    ChunkStorage storage(3);

    FallbackCompleter completer(fetcher, storage, log);
    EXPECT_TRUE(completer.Run());

    EXPECT_EQ(completer.FetchesIssued(), 3u);
    EXPECT_EQ(completer.PlaceholdersInserted(), 2u);

    std::string hashed(2, kPlaceholderByte);
    hashed += "c";
    EXPECT_EQ(utils::HexEncode(storage.Finalize()), HexSha256(hashed));
}

TEST_F(FallbackCompleterTest, EveryRoundAdvancesTheWatermark) {
    FakeRangeFetcher fetcher("abcde");
    for (uint64_t offset = 2; offset < 5; ++offset) {
        fetcher.FailAt(offset);
    }
    ChunkStorage storage(5);
    storage.Insert(0, "ab");

    FallbackCompleter completer(fetcher, storage, log);
    EXPECT_TRUE(completer.Run());

    EXPECT_EQ(fetcher.Calls(), (Calls{ { 2, 4 }, { 3, 4 }, { 4, 4 } }));
    EXPECT_EQ(completer.PlaceholdersInserted(), 3u);
    EXPECT_TRUE(storage.IsComplete());
}

TEST_F(FallbackCompleterTest, OverrunIsFatal) {
    FakeRangeFetcher fetcher(kResource);
    fetcher.SetTrailingGarbage("XX");
    ChunkStorage storage(10);
    storage.Insert(0, "0123");

    FallbackCompleter completer(fetcher, storage, log);
    EXPECT_THROW(completer.Run(), IntegrityError);
    EXPECT_EQ(storage.BytesHashed(), 4u);
}
