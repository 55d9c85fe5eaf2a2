#include "core/DownloadClient.hpp"

#include <exception>
#include <thread>

#include "core/ByteRange.hpp"
#include "core/FallbackCompleter.hpp"
#include "utils/byte_tools.hpp"

DownloadClient::DownloadClient(ActivityLog& log) : log(log) {}

void DownloadClient::SetStatus(DownloadStatus status) {
    std::lock_guard<std::mutex> lock(task_mutex);
    task.status = status;
}

DownloadResult DownloadClient::Download(const DownloadOptions& options) {
    {
        std::lock_guard<std::mutex> lock(task_mutex);
        task = DownloadTask();
        task.target = options.endpoint.ToString();
        task.status = DownloadStatus::kProbing;
        task.start_time = std::chrono::steady_clock::now();
    }

    HttpRangeFetcher fetcher(options.endpoint, options.connect_timeout,
                             options.read_timeout, log);

    uint64_t total_size;
    try {
        total_size = fetcher.ProbeResourceSize();
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(task_mutex);
        task.status = DownloadStatus::kError;
        task.error_message = e.what();
        throw;
    }

    log.Info("Total size to download: " + std::to_string(total_size) + " bytes");
    return Run(fetcher, total_size, options.worker_count, options.output_file);
}

DownloadResult DownloadClient::Run(RangeFetcher& fetcher, uint64_t total_size, size_t worker_count,
                                   const std::optional<std::filesystem::path>& output_file) {
    auto start_time = std::chrono::steady_clock::now();

    try {
        auto run_storage = std::make_shared<ChunkStorage>(total_size, output_file);

        std::vector<std::shared_ptr<RangeWorker>> run_workers;
        size_t worker_id = 1;
        for (const ByteRange& range : PartitionRanges(total_size, worker_count)) {
            run_workers.push_back(
                std::make_shared<RangeWorker>(worker_id++, range, fetcher, *run_storage, log));
        }

        {
            std::lock_guard<std::mutex> lock(task_mutex);
            storage = run_storage;
            workers = run_workers;
            task.status = DownloadStatus::kDownloading;
            task.total_size = total_size;
            task.total_workers = run_workers.size();
            task.fallback_fetches = 0;
        }

        log.Info("Starting " + std::to_string(run_workers.size()) + " workers for " +
                 std::to_string(total_size) + " bytes");
        RunWorkers(run_workers);

        SetStatus(DownloadStatus::kCompleting);
        log.Info("All workers finished, hashed " + std::to_string(run_storage->BytesHashed()) +
                 "/" + std::to_string(total_size) + " bytes, " +
                 std::to_string(run_storage->PendingChunksCount()) + " chunks pending");

        FallbackCompleter completer(fetcher, *run_storage, log);
        bool is_complete = completer.Run();

        DownloadResult result;
        result.total_size = total_size;
        result.bytes_hashed = run_storage->BytesHashed();
        result.digest_hex = utils::HexEncode(run_storage->Finalize());
        result.worker_count = run_workers.size();
        result.chunks_merged = run_storage->ChunksMerged();
        result.chunks_discarded = run_storage->ChunksDiscarded();
        result.fallback_fetches = completer.FetchesIssued();
        result.placeholders = completer.PlaceholdersInserted();
        for (const auto& worker : run_workers) {
            result.placeholders += worker->PlaceholdersInserted();
        }
        result.is_complete = is_complete;
        run_storage->CloseOutputFile();

        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (result.placeholders > 0) {
            log.Warning(std::to_string(result.placeholders) +
                        " placeholder bytes were hashed, the digest does not match the remote resource");
        }

        {
            std::lock_guard<std::mutex> lock(task_mutex);
            task.status = is_complete ? DownloadStatus::kCompleted : DownloadStatus::kIncomplete;
            task.digest_hex = result.digest_hex;
            task.fallback_fetches = result.fallback_fetches;
        }
        return result;

    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(task_mutex);
        task.status = DownloadStatus::kError;
        task.error_message = e.what();
        throw;
    }
}

void DownloadClient::RunWorkers(const std::vector<std::shared_ptr<RangeWorker>>& run_workers) {
    std::vector<std::thread> worker_threads;
    std::vector<std::exception_ptr> errors(run_workers.size());

    auto join_all = [&worker_threads]() {
        for (auto& thread : worker_threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    };

    try {
        worker_threads.reserve(run_workers.size());
        for (size_t i = 0; i < run_workers.size(); ++i) {
            worker_threads.emplace_back([worker = run_workers[i], &error = errors[i], this]() {
                try {
                    worker->Run();
                } catch (const std::exception& e) {
                    log.Error("Worker " + std::to_string(worker->GetId()) + " aborted: " + e.what());
                    error = std::current_exception();
                }
            });
        }
    } catch (const std::exception& e) {
        log.Error("Failed to start worker thread " + std::to_string(worker_threads.size() + 1) +
                  " of " + std::to_string(run_workers.size()) + ": " + e.what());
        join_all();
        throw;
    }

    join_all();

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
}

DownloadTask DownloadClient::GetCurrentTask() const {
    std::lock_guard<std::mutex> lock(task_mutex);

    DownloadTask snapshot = task;
    if (storage) {
        snapshot.bytes_hashed = storage->BytesHashed();
        snapshot.pending_bytes = storage->PendingBytes();
        if (snapshot.total_size > 0) {
            snapshot.progress = static_cast<double>(snapshot.bytes_hashed) /
                                static_cast<double>(snapshot.total_size) * 100.0;
        } else if (snapshot.status == DownloadStatus::kCompleted) {
            snapshot.progress = 100.0;
        }
    }

    for (const auto& worker : workers) {
        if (!worker->IsFinished()) {
            ++snapshot.active_workers;
        }
        snapshot.chunks_fetched += worker->ChunksFetched();
        snapshot.placeholders += worker->PlaceholdersInserted();
    }
    return snapshot;
}
