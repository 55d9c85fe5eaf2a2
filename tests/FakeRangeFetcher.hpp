#pragma once

#include <algorithm>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "net/RangeFetcher.hpp"
#include "utils/Errors.hpp"

// Serves ranges of an in-memory resource. Individual offsets can be scripted
// to fail, come back empty or be cut short.
class FakeRangeFetcher : public RangeFetcher {
public:
    explicit FakeRangeFetcher(std::string resource) : resource(std::move(resource)) {}

    std::string FetchRange(uint64_t first, uint64_t last) override {
        std::lock_guard<std::mutex> lock(mutex);
        calls.emplace_back(first, last);

        auto failure = failures.find(first);
        if (failure != failures.end() && failure->second > 0) {
            --failure->second;
            throw IoError(IoError::kReceive, "scripted failure at " + std::to_string(first));
        }

        auto empty = empties.find(first);
        if (empty != empties.end() && empty->second > 0) {
            --empty->second;
            return "";
        }

        if (first >= resource.size()) {
            return "";
        }

        uint64_t length = std::min<uint64_t>(last, resource.size() - 1) - first + 1;
        length = std::min<uint64_t>(length, max_bytes_per_response);
        auto limit = limits.find(first);
        if (limit != limits.end()) {
            length = std::min<uint64_t>(length, limit->second);
        }
        return resource.substr(first, length) + trailing_garbage;
    }

    void FailAt(uint64_t offset, int times = 1) { failures[offset] += times; }
    void EmptyAt(uint64_t offset, int times = 1) { empties[offset] += times; }
    void LimitAt(uint64_t offset, uint64_t max_bytes) { limits[offset] = max_bytes; }
    void SetMaxBytesPerResponse(uint64_t max_bytes) { max_bytes_per_response = max_bytes; }
    void SetTrailingGarbage(std::string garbage) { trailing_garbage = std::move(garbage); }

    std::vector<std::pair<uint64_t, uint64_t>> Calls() const {
        std::lock_guard<std::mutex> lock(mutex);
        return calls;
    }

private:
    mutable std::mutex mutex;
    std::string resource;
    std::map<uint64_t, int> failures;
    std::map<uint64_t, int> empties;
    std::map<uint64_t, uint64_t> limits;
    uint64_t max_bytes_per_response = UINT64_MAX;
    std::string trailing_garbage;
    std::vector<std::pair<uint64_t, uint64_t>> calls;
};
