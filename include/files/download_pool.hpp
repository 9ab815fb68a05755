#pragma once

#include "files/file_downloader.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace dbsync {

/**
 * @brief Bounded worker pool for file downloads
 *
 * Files are submitted per record. Once every file of a record has a final
 * status, its completion callback runs on the worker that finished last,
 * so metadata ingestion never waits on the object store.
 *
 * cancel(): in-flight downloads finish (a pending backoff is cut short),
 * queued files complete as SKIPPED "cancelled", later submissions complete
 * immediately the same way.
 */
class DownloadPool {
public:
    using Completion = std::function<void(const std::string& doc_id, const std::vector<DownloadResult>&)>;

    struct Stats {
        uint64_t submitted = 0;
        uint64_t succeeded = 0;
        uint64_t skipped = 0;
        uint64_t failed = 0;
    };

    DownloadPool(std::shared_ptr<const FileDownloader> downloader, size_t workers);
    ~DownloadPool();

    DownloadPool(const DownloadPool&) = delete;
    DownloadPool& operator=(const DownloadPool&) = delete;

    void submit(std::string doc_id, std::vector<DetectedFile> files, Completion on_complete);

    void cancel();

    // Block until the queue is empty and nothing is in flight
    void wait_idle();

    // Stop the workers; queued files complete as cancelled
    void shutdown();

    [[nodiscard]] Stats stats() const;

private:
    struct RecordBatch {
        std::string doc_id;
        std::vector<DownloadResult> results;
        std::atomic<size_t> remaining{0};
        Completion on_complete;
    };

    struct Task {
        std::shared_ptr<RecordBatch> batch;
        size_t index = 0;
        DetectedFile file;
    };

    void worker_loop(std::stop_token st);
    void finish(const Task& task, DownloadResult result);
    static void run_completion(RecordBatch& batch);

    std::shared_ptr<const FileDownloader> downloader_;

    std::mutex mutex_;
    std::condition_variable_any work_cv_;
    std::condition_variable idle_cv_;
    std::deque<Task> queue_;
    size_t in_flight_ = 0;

    std::stop_source cancel_source_;
    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> succeeded_{0};
    std::atomic<uint64_t> skipped_{0};
    std::atomic<uint64_t> failed_{0};

    std::vector<std::jthread> workers_;
};

} // namespace dbsync
