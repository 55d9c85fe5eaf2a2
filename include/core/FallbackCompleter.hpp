#pragma once

#include "core/ChunkStorage.hpp"
#include "net/RangeFetcher.hpp"
#include "utils/ActivityLog.hpp"

// Runs after every worker has joined. Drains the storage and fetches
// whatever lies between the watermark and the end of the resource until
// nothing is missing.
class FallbackCompleter {
public:
    FallbackCompleter(RangeFetcher& fetcher, ChunkStorage& storage, ActivityLog& log);

    // Returns once the watermark reaches the resource size, placeholders
    // included. IntegrityError propagates.
    bool Run();

    size_t FetchesIssued() const;
    size_t PlaceholdersInserted() const;

private:
    RangeFetcher& fetcher;
    ChunkStorage& storage;
    ActivityLog& log;

    size_t fetches_issued = 0;
    size_t placeholders = 0;
};
