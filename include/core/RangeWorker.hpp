#pragma once

#include <atomic>
#include <string>

#include "core/ByteRange.hpp"
#include "core/ChunkStorage.hpp"
#include "net/RangeFetcher.hpp"
#include "utils/ActivityLog.hpp"

constexpr char kPlaceholderByte = '\0';

struct FetchOutcome {
    std::string data;
    bool is_placeholder;
};

// Fetches [first, last]. A failed fetch or an empty body is logged and turned
// into a single placeholder byte so the caller can still advance.
FetchOutcome FetchOrPlaceholder(RangeFetcher& fetcher, uint64_t first, uint64_t last,
                                ActivityLog& log, const std::string& requester);

class RangeWorker {
public:
    RangeWorker(size_t id, ByteRange range, RangeFetcher& fetcher,
                ChunkStorage& storage, ActivityLog& log);

    // Returns once the cursor has passed the end of the range. Only
    // IntegrityError propagates; fetch failures never end the loop.
    void Run();

    size_t GetId() const;
    const ByteRange& GetRange() const;
    uint64_t GetCursor() const;
    size_t ChunksFetched() const;
    size_t PlaceholdersInserted() const;
    bool IsFinished() const;

private:
    void Deposit(uint64_t offset, std::string data);

    const size_t id;
    const ByteRange range;
    RangeFetcher& fetcher;
    ChunkStorage& storage;
    ActivityLog& log;

    std::atomic<uint64_t> cursor;
    std::atomic<size_t> chunks_fetched{0};
    std::atomic<size_t> placeholders{0};
    std::atomic<bool> is_finished{false};
};
