#include "core/RangeWorker.hpp"

#include "utils/Errors.hpp"

FetchOutcome FetchOrPlaceholder(RangeFetcher& fetcher, uint64_t first, uint64_t last,
                                ActivityLog& log, const std::string& requester) {
    const std::string range_text = std::to_string(first) + "-" + std::to_string(last);

    std::string failure;
    try {
        std::string data = fetcher.FetchRange(first, last);
        if (!data.empty()) {
            return { std::move(data), false };
        }
        failure = "empty response";
    } catch (const IoError& e) {
        failure = e.what();
    } catch (const ProtocolError& e) {
        failure = e.what();
    } catch (const DecodeError& e) {
        failure = e.what();
    }

    log.Error(requester + ": failed to download " + range_text + " (" + failure +
              "), skipping 1 byte");
    return { std::string(1, kPlaceholderByte), true };
}

RangeWorker::RangeWorker(size_t id, ByteRange range, RangeFetcher& fetcher,
                         ChunkStorage& storage, ActivityLog& log)
    : id(id),
      range(range),
      fetcher(fetcher),
      storage(storage),
      log(log),
      cursor(range.start) {}

void RangeWorker::Run() {
    const std::string name = "Worker " + std::to_string(id);
    log.Info(name + ": assigned bytes " + std::to_string(range.start) + "-" +
             std::to_string(range.end));

    while (cursor <= range.end) {
        const uint64_t offset = cursor;
        FetchOutcome outcome = FetchOrPlaceholder(fetcher, offset, range.end, log, name);

        const uint64_t length = outcome.data.size();
        if (outcome.is_placeholder) {
            ++placeholders;
        } else {
            ++chunks_fetched;
            log.Info(name + ": received " + std::to_string(length) + " bytes at offset " +
                     std::to_string(offset));
        }

        Deposit(offset, std::move(outcome.data));
        cursor = offset + length;
    }

    is_finished = true;
    log.Info(name + ": finished (" + std::to_string(chunks_fetched) + " chunks, " +
             std::to_string(placeholders) + " placeholders)");
}

void RangeWorker::Deposit(uint64_t offset, std::string data) {
    if (!storage.Insert(offset, std::move(data))) {
        log.Warning("Worker " + std::to_string(id) + ": chunk at offset " +
                    std::to_string(offset) + " already buffered, keeping the first one");
    }
    storage.Merge();
}

size_t RangeWorker::GetId() const {
    return id;
}

const ByteRange& RangeWorker::GetRange() const {
    return range;
}

uint64_t RangeWorker::GetCursor() const {
    return cursor;
}

size_t RangeWorker::ChunksFetched() const {
    return chunks_fetched;
}

size_t RangeWorker::PlaceholdersInserted() const {
    return placeholders;
}

bool RangeWorker::IsFinished() const {
    return is_finished;
}
