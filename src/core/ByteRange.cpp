#include "core/ByteRange.hpp"

#include <algorithm>
#include <stdexcept>

std::vector<ByteRange> PartitionRanges(uint64_t total_size, size_t workers) {
    if (workers == 0) {
        throw std::invalid_argument("Worker count must be at least 1");
    }

    std::vector<ByteRange> ranges;
    if (total_size == 0) {
        return ranges;
    }

    // No more ranges than bytes; also keeps the ceiling division below from overflowing.
    const uint64_t range_count = std::min<uint64_t>(workers, total_size);
    const uint64_t chunk_size = total_size / range_count + (total_size % range_count != 0 ? 1 : 0);

    uint64_t start = 0;
    for (uint64_t i = 0; i < range_count && start < total_size; ++i) {
        uint64_t length = std::min(chunk_size, total_size - start);
        ranges.push_back(ByteRange{start, start + length - 1});
        start += length;
    }
    return ranges;
}
