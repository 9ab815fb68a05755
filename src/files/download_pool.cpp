#include "files/download_pool.hpp"
#include "core/utils.hpp"

#include <format>

namespace dbsync {

namespace {

DownloadResult cancelled_result(const DetectedFile& file) {
    DownloadResult r;
    r.locator = file.locator;
    r.status = DownloadStatus::SKIPPED;
    r.reason = "cancelled";
    return r;
}

} // namespace

DownloadPool::DownloadPool(std::shared_ptr<const FileDownloader> downloader, size_t workers)
    : downloader_(std::move(downloader)) {
    const size_t n = workers == 0 ? 1 : workers;
    workers_.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        workers_.emplace_back([this](std::stop_token st) { worker_loop(st); });
    }
    utils::log::debug(std::format("Download pool started with {} workers", n));
}

DownloadPool::~DownloadPool() {
    shutdown();
}

void DownloadPool::submit(std::string doc_id, std::vector<DetectedFile> files, Completion on_complete) {
    auto batch = std::make_shared<RecordBatch>();
    batch->doc_id = std::move(doc_id);
    batch->results.resize(files.size());
    batch->remaining.store(files.size());
    batch->on_complete = std::move(on_complete);
    submitted_.fetch_add(files.size());

    if (files.empty()) {
        run_completion(*batch);
        return;
    }

    if (cancel_source_.stop_requested()) {
        for (size_t i = 0; i < files.size(); ++i) {
            batch->results[i] = cancelled_result(files[i]);
        }
        skipped_.fetch_add(files.size());
        run_completion(*batch);
        return;
    }

    {
        std::lock_guard lock(mutex_);
        for (size_t i = 0; i < files.size(); ++i) {
            queue_.push_back(Task{batch, i, std::move(files[i])});
        }
    }
    work_cv_.notify_all();
}

void DownloadPool::cancel() {
    cancel_source_.request_stop();

    std::deque<Task> dropped;
    {
        std::lock_guard lock(mutex_);
        dropped.swap(queue_);
    }
    for (const auto& task : dropped) {
        finish(task, cancelled_result(task.file));
    }
    idle_cv_.notify_all();
}

void DownloadPool::wait_idle() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && in_flight_ == 0; });
}

void DownloadPool::shutdown() {
    if (workers_.empty()) return;
    cancel();
    for (auto& w : workers_) w.request_stop();
    work_cv_.notify_all();
    workers_.clear();   // jthread joins
}

DownloadPool::Stats DownloadPool::stats() const {
    return Stats{submitted_.load(), succeeded_.load(), skipped_.load(), failed_.load()};
}

void DownloadPool::worker_loop(std::stop_token st) {
    while (true) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            if (!work_cv_.wait(lock, st, [this] { return !queue_.empty(); })) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            ++in_flight_;
        }

        auto result = downloader_->download(task.file, cancel_source_.get_token());
        finish(task, std::move(result));

        {
            std::lock_guard lock(mutex_);
            --in_flight_;
        }
        idle_cv_.notify_all();
    }
}

void DownloadPool::finish(const Task& task, DownloadResult result) {
    switch (result.status) {
        case DownloadStatus::SUCCESS: succeeded_.fetch_add(1); break;
        case DownloadStatus::SKIPPED: skipped_.fetch_add(1); break;
        case DownloadStatus::FAILED: failed_.fetch_add(1); break;
        default: break;
    }
    task.batch->results[task.index] = std::move(result);
    if (task.batch->remaining.fetch_sub(1) == 1) {
        run_completion(*task.batch);
    }
}

void DownloadPool::run_completion(RecordBatch& batch) {
    if (!batch.on_complete) return;
    try {
        batch.on_complete(batch.doc_id, batch.results);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Download completion for {} failed: {}", batch.doc_id, e.what()));
    }
}

} // namespace dbsync
