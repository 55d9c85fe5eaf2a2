#include "core/ChunkStorage.hpp"

#include "utils/Errors.hpp"

ChunkStorage::ChunkStorage(uint64_t total_size,
                           const std::optional<std::filesystem::path>& output_file)
    : total_size(total_size) {

    if (output_file) {
        file_name = output_file->generic_string();
        file.open(file_name, std::ios::out | std::ios::binary | std::ios::trunc);

        if (!file.is_open()) {
            throw std::runtime_error("Failed to open output file: " + file_name);
        }
    }
}

bool ChunkStorage::Insert(uint64_t offset, std::string data) {
    std::lock_guard<std::mutex> lock(storage_mutex);
    return chunks.emplace(offset, std::move(data)).second;
}

uint64_t ChunkStorage::Merge() {
    std::lock_guard<std::mutex> lock(storage_mutex);

    uint64_t merged = 0;
    while (!chunks.empty()) {
        auto head = chunks.begin();
        const uint64_t offset = head->first;

        if (offset < bytes_hashed) {
            chunks.erase(head);
            ++chunks_discarded;
            continue;
        }

        if (offset > bytes_hashed) {
            break;
        }

        const std::string& data = head->second;
        if (data.size() > total_size - bytes_hashed) {
            throw IntegrityError(IntegrityError::kOverrun,
                                 "Chunk at offset " + std::to_string(offset) + " of " +
                                 std::to_string(data.size()) + " bytes runs past resource end " +
                                 std::to_string(total_size));
        }

        SaveToDisk(data);
        hasher.Update(data);
        bytes_hashed += data.size();
        merged += data.size();
        ++chunks_merged;
        chunks.erase(head);
    }

    if (bytes_hashed > total_size) {
        throw IntegrityError(IntegrityError::kOverrun,
                             "Hashed " + std::to_string(bytes_hashed) + " bytes, resource has " +
                             std::to_string(total_size));
    }
    return merged;
}

std::string ChunkStorage::Finalize() {
    std::lock_guard<std::mutex> lock(storage_mutex);
    return hasher.Finalize();
}

void ChunkStorage::SaveToDisk(const std::string& data) {
    if (!file.is_open()) {
        return;
    }

    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!file) {
        throw std::runtime_error("Failed to write " + std::to_string(data.size()) +
                                 " bytes to " + file_name);
    }
}

uint64_t ChunkStorage::BytesHashed() const {
    std::lock_guard<std::mutex> lock(storage_mutex);
    return bytes_hashed;
}

uint64_t ChunkStorage::TotalSize() const {
    return total_size;
}

bool ChunkStorage::IsComplete() const {
    std::lock_guard<std::mutex> lock(storage_mutex);
    return bytes_hashed == total_size;
}

size_t ChunkStorage::PendingChunksCount() const {
    std::lock_guard<std::mutex> lock(storage_mutex);
    return chunks.size();
}

uint64_t ChunkStorage::PendingBytes() const {
    std::lock_guard<std::mutex> lock(storage_mutex);

    uint64_t bytes = 0;
    for (const auto& [offset, data] : chunks) {
        bytes += data.size();
    }
    return bytes;
}

size_t ChunkStorage::ChunksMerged() const {
    std::lock_guard<std::mutex> lock(storage_mutex);
    return chunks_merged;
}

size_t ChunkStorage::ChunksDiscarded() const {
    std::lock_guard<std::mutex> lock(storage_mutex);
    return chunks_discarded;
}

void ChunkStorage::CloseOutputFile() {
    std::lock_guard<std::mutex> lock(storage_mutex);
    if (file.is_open()) {
        file.flush();
        file.close();
    }
}
