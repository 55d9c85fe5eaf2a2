#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/ChunkStorage.hpp"
#include "core/DownloadTask.hpp"
#include "core/RangeWorker.hpp"
#include "net/Endpoint.hpp"
#include "net/RangeFetcher.hpp"
#include "utils/ActivityLog.hpp"

struct DownloadOptions {
    Endpoint endpoint;
    size_t worker_count = 1;
    std::chrono::milliseconds connect_timeout{0};
    std::chrono::milliseconds read_timeout{0};
    std::optional<std::filesystem::path> output_file;
};

struct DownloadResult {
    uint64_t total_size = 0;
    uint64_t bytes_hashed = 0;
    std::string digest_hex;
    size_t worker_count = 0;
    size_t chunks_merged = 0;
    size_t chunks_discarded = 0;
    size_t placeholders = 0;
    size_t fallback_fetches = 0;
    std::chrono::milliseconds elapsed{0};
    bool is_complete = false;
};

class DownloadClient {
public:
    explicit DownloadClient(ActivityLog& log);

    // Probes the resource size, then runs the download against the endpoint.
    DownloadResult Download(const DownloadOptions& options);

    // Partitions [0, total_size) across `worker_count` threads, joins them and
    // repairs remaining gaps. Rethrows the first fatal worker error after all
    // workers have joined.
    DownloadResult Run(RangeFetcher& fetcher, uint64_t total_size, size_t worker_count,
                       const std::optional<std::filesystem::path>& output_file = std::nullopt);

    DownloadTask GetCurrentTask() const;

private:
    void RunWorkers(const std::vector<std::shared_ptr<RangeWorker>>& workers);
    void SetStatus(DownloadStatus status);

    ActivityLog& log;

    mutable std::mutex task_mutex;
    DownloadTask task;
    std::shared_ptr<ChunkStorage> storage;
    std::vector<std::shared_ptr<RangeWorker>> workers;
};
