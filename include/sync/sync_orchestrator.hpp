#pragma once

#include "core/types.hpp"
#include "db/isource_reader.hpp"
#include "files/download_pool.hpp"
#include "files/file_downloader.hpp"
#include "index/iindex_sink.hpp"
#include "ingest/record_transformer.hpp"
#include "schema/schema_discovery.hpp"
#include "sync/change_detector.hpp"
#include "sync/icheckpoint_store.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace dbsync {

/**
 * @brief Everything a run touches, constructed once and passed in
 *
 * downloader may be null (downloads disabled).
 */
struct SyncContext {
    ISourceReader& source;
    ICheckpointStore& checkpoints;
    IIndexSink& index;
    std::shared_ptr<const FileDownloader> downloader;
};

struct SyncOptions {
    size_t batch_size = 500;
    size_t table_workers = 4;
    size_t download_workers = 4;
    std::vector<std::string> default_exclude = {"_prisma_migrations", "sync_events", "webhook_*"};
    bool reconcile_deletes = false;
    size_t delete_sample_size = 1000;
    std::string schema_cache_path;          // Empty = always introspect
    bool index_schema_metadata = false;     // After discovery runs
    DiscoveryOptions discovery;
    TransformOptions transform;
};

struct RunRequest {
    TableFilter filter;
    bool dry_run = false;
};

/**
 * @brief Drives full and incremental runs across tables
 *
 * Job states: PENDING -> RUNNING -> COMPLETED | FAILED | CANCELLED.
 * FAILED only follows a ConnectionError that outlived its retries; row,
 * file and table failures are reported in the result. One job runs at a
 * time.
 *
 * Tables run concurrently on table_workers threads. Within a table,
 * batches are processed in stream order and a checkpoint is written after
 * each batch.
 */
class SyncOrchestrator {
public:
    SyncOrchestrator(SyncContext context, SyncOptions options);
    ~SyncOrchestrator();

    SyncOrchestrator(const SyncOrchestrator&) = delete;
    SyncOrchestrator& operator=(const SyncOrchestrator&) = delete;

    [[nodiscard]] SyncResult run_full(const RunRequest& request = {});
    [[nodiscard]] SyncResult run_incremental(const RunRequest& request = {});

    /**
     * @brief Re-introspect the source (refreshing the cache) and, when
     * configured, index schema metadata documents
     */
    [[nodiscard]] SyncResult run_schema_discovery();

    // Run one table in either mode, outside any filter
    [[nodiscard]] SyncResult sync_table(const std::string& table, bool full, bool dry_run = false);

    /**
     * @brief Current schema: memory, then the cache file, then introspection
     * @throws ConnectionError, CancelledError
     */
    [[nodiscard]] std::shared_ptr<const SchemaMap> schema(bool refresh = false);

    [[nodiscard]] SyncStatus status();

    // Cancel the running job, if any
    void cancel();

    // Forget progress for one table or all tables
    void reset(const std::optional<std::string>& table = std::nullopt);

    // table:<name> and schema:<database> documents; returns how many were written
    size_t index_schema_metadata();

private:
    struct Job;

    [[nodiscard]] SyncResult run(SyncMode mode, const RunRequest& request);
    [[nodiscard]] std::shared_ptr<Job> begin_job(SyncMode mode, const RunRequest& request);
    [[nodiscard]] SyncResult finish_job(const std::shared_ptr<Job>& job);

    void run_tables(Job& job, const SchemaMap& schema, const std::vector<std::string>& tables);
    void process_table(Job& job, const Table& table);
    void stream_table(Job& job, const Table& table);

    std::shared_ptr<const SchemaMap> discover_and_cache();

    SyncContext ctx_;
    SyncOptions options_;
    ChangeDetector detector_;

    std::mutex schema_mutex_;
    std::shared_ptr<const SchemaMap> schema_;

    std::mutex job_mutex_;
    std::shared_ptr<Job> current_job_;
};

} // namespace dbsync
