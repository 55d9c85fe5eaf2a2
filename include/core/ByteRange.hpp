#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// Closed interval [start, end] of byte offsets.
struct ByteRange {
    uint64_t start;
    uint64_t end;

    uint64_t Length() const { return end - start + 1; }
};

// Splits [0, total_size) into at most `workers` ranges of ceil(total_size / workers)
// bytes each. Ranges that would start at or past total_size are not produced.
std::vector<ByteRange> PartitionRanges(uint64_t total_size, size_t workers);
