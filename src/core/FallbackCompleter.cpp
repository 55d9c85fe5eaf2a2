#include "core/FallbackCompleter.hpp"

#include "core/RangeWorker.hpp"

FallbackCompleter::FallbackCompleter(RangeFetcher& fetcher, ChunkStorage& storage, ActivityLog& log)
    : fetcher(fetcher), storage(storage), log(log) {}

bool FallbackCompleter::Run() {
    const uint64_t total_size = storage.TotalSize();

    storage.Merge();
    // Each round inserts at least one byte at the watermark, so it either advances or throws.
    while (storage.BytesHashed() < total_size) {
        const uint64_t watermark = storage.BytesHashed();
        log.Info("Gap at offset " + std::to_string(watermark) + ", requesting range " +
                 std::to_string(watermark) + "-" + std::to_string(total_size - 1));

        FetchOutcome outcome = FetchOrPlaceholder(fetcher, watermark, total_size - 1, log, "Fallback");
        ++fetches_issued;
        if (outcome.is_placeholder) {
            ++placeholders;
        } else {
            log.Info("Fallback: received " + std::to_string(outcome.data.size()) + " bytes");
        }

        if (!storage.Insert(watermark, std::move(outcome.data))) {
            log.Warning("Fallback: offset " + std::to_string(watermark) + " already buffered");
        }
        storage.Merge();
    }
    return storage.IsComplete();
}

size_t FallbackCompleter::FetchesIssued() const {
    return fetches_issued;
}

size_t FallbackCompleter::PlaceholdersInserted() const {
    return placeholders;
}
