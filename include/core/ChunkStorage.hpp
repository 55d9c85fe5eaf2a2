#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "utils/Sha256Hasher.hpp"

/*
 * Reassembly buffer shared by all range workers.
 *
 * Chunks are keyed by the offset they are believed to start at. Merge()
 * feeds the hash strictly in offset order: entries behind the watermark are
 * dropped unread, the entry at the watermark is hashed, and the first gap
 * stops the pass. The map, the watermark and the hash live under one mutex
 * so they are never observed out of step.
 */
class ChunkStorage {
public:
    explicit ChunkStorage(uint64_t total_size,
                          const std::optional<std::filesystem::path>& output_file = std::nullopt);

    // Returns false when a chunk is already buffered at this offset; the
    // existing chunk is kept.
    bool Insert(uint64_t offset, std::string data);

    // Returns the number of bytes hashed by this pass. Throws
    // IntegrityError(kOverrun) if the next chunk would run past the resource
    // end; the watermark is left untouched in that case.
    uint64_t Merge();

    // Raw SHA-256 of everything hashed so far. Only once.
    std::string Finalize();

    uint64_t BytesHashed() const;
    uint64_t TotalSize() const;
    bool IsComplete() const;

    size_t PendingChunksCount() const;
    uint64_t PendingBytes() const;
    size_t ChunksMerged() const;
    size_t ChunksDiscarded() const;

    void CloseOutputFile();

private:
    void SaveToDisk(const std::string& data);

    mutable std::mutex storage_mutex;
    std::map<uint64_t, std::string> chunks;
    const uint64_t total_size;
    uint64_t bytes_hashed = 0;
    Sha256Hasher hasher;

    std::ofstream file;
    std::string file_name;

    size_t chunks_merged = 0;
    size_t chunks_discarded = 0;
};
