#pragma once

#include <chrono>
#include <cstdint>
#include <string>

enum class DownloadStatus {
    kIdle,
    kProbing,
    kDownloading,
    kCompleting,
    kCompleted,
    kIncomplete,
    kError
};

// Snapshot of a run, polled by the terminal UI.
struct DownloadTask {
    std::string target;
    DownloadStatus status;
    double progress;

    uint64_t total_size;
    uint64_t bytes_hashed;
    uint64_t pending_bytes;

    size_t active_workers;
    size_t total_workers;
    size_t chunks_fetched;
    size_t placeholders;
    size_t fallback_fetches;

    std::string digest_hex;
    std::string error_message;

    std::chrono::steady_clock::time_point start_time;

    DownloadTask() : status(DownloadStatus::kIdle),
                     progress(0.0),
                     total_size(0),
                     bytes_hashed(0),
                     pending_bytes(0),
                     active_workers(0),
                     total_workers(0),
                     chunks_fetched(0),
                     placeholders(0),
                     fallback_fetches(0) {}

    std::string GetFormattedSize() const;
    std::string GetFormattedHashed() const;
    std::string GetFormattedProgress() const;
    std::string GetStatusString() const;
    std::string GetWorkersString() const;
};
