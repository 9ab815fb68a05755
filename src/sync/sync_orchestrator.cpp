#include "sync/sync_orchestrator.hpp"
#include "sync/table_selector.hpp"
#include "files/file_detector.hpp"
#include "index/document_builder.hpp"
#include "schema/schema_export.hpp"
#include "core/timestamp.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <map>
#include <thread>

namespace dbsync {

// ============================================================================
// Job
// ============================================================================

struct SyncOrchestrator::Job {
    std::mutex mutex;
    SyncResult result;
    std::map<std::string, TableProgress> progress;

    std::stop_source stop;
    std::atomic<bool> fatal{false};
    std::atomic<bool> cancelled{false};

    std::shared_ptr<const SchemaMap> schema;
    std::unique_ptr<RecordTransformer> transformer;

    // Declared last: destroyed first, its completions use the members above
    std::unique_ptr<DownloadPool> downloads;

    void add_error(const std::string& table, std::optional<std::string> row_id,
                   ErrorCategory category, ErrorSeverity severity, std::string message) {
        SyncErrorEntry entry;
        entry.table = table;
        entry.row_id = std::move(row_id);
        entry.category = category;
        entry.severity = severity;
        entry.message = std::move(message);
        entry.timestamp = utils::now();
        std::lock_guard lock(mutex);
        result.errors.push_back(std::move(entry));
    }

    template<typename Fn>
    void update(const std::string& table, Fn&& fn) {
        std::lock_guard lock(mutex);
        auto& p = progress[table];
        p.table = table;
        fn(p);
    }

    [[nodiscard]] bool dry_run() const { return result.dry_run; }
    [[nodiscard]] SyncMode mode() const { return result.mode; }
};

namespace {

struct PendingRecord {
    IngestedRecord record;
    std::vector<DetectedFile> files;
    bool indexed = true;
};

} // namespace

// ============================================================================
// Construction
// ============================================================================

SyncOrchestrator::SyncOrchestrator(SyncContext context, SyncOptions options)
    : ctx_(std::move(context)),
      options_(std::move(options)),
      detector_(ctx_.source, options_.batch_size) {}

SyncOrchestrator::~SyncOrchestrator() {
    cancel();
}

// ============================================================================
// Schema
// ============================================================================

std::shared_ptr<const SchemaMap> SyncOrchestrator::discover_and_cache() {
    SchemaDiscovery discovery(ctx_.source, options_.discovery);
    auto map = discovery.discover();

    if (!options_.schema_cache_path.empty()) {
        const auto saved = save_schema_cache(options_.schema_cache_path, *map);
        if (saved.is_error()) {
            utils::log::warn(std::format("Schema cache not written: {}", saved.error_message()));
        }
    }
    return map;
}

std::shared_ptr<const SchemaMap> SyncOrchestrator::schema(bool refresh) {
    std::lock_guard lock(schema_mutex_);
    if (schema_ && !refresh) return schema_;

    if (!refresh && !options_.schema_cache_path.empty() &&
        std::filesystem::exists(options_.schema_cache_path)) {
        auto loaded = load_schema_cache(options_.schema_cache_path);
        if (loaded.is_ok()) {
            schema_ = loaded.value();
            utils::log::info(std::format("Using cached schema from {} ({} tables)",
                options_.schema_cache_path, schema_->tables.size()));
            return schema_;
        }
        utils::log::warn(std::format("Ignoring schema cache: {}", loaded.error_message()));
    }

    schema_ = discover_and_cache();
    return schema_;
}

// ============================================================================
// Job lifecycle
// ============================================================================

std::shared_ptr<SyncOrchestrator::Job> SyncOrchestrator::begin_job(SyncMode mode, const RunRequest& request) {
    std::lock_guard lock(job_mutex_);
    if (current_job_) {
        std::lock_guard job_lock(current_job_->mutex);
        if (!is_terminal(current_job_->result.state)) {
            throw SyncError(ErrorCategory::INTERNAL_ERROR,
                std::format("sync job {} is still running", current_job_->result.job_id));
        }
    }

    auto job = std::make_shared<Job>();
    job->result.job_id = utils::generate_uuid();
    job->result.mode = mode;
    job->result.state = JobState::PENDING;
    job->result.dry_run = request.dry_run;
    job->result.filter = request.filter;
    job->result.started_at = utils::now();
    current_job_ = job;

    utils::log::info(std::format("Sync job {} started: mode={}{}",
        job->result.job_id, sync_mode_to_string(mode), request.dry_run ? " (dry run)" : ""));
    return job;
}

SyncResult SyncOrchestrator::finish_job(const std::shared_ptr<Job>& job) {
    if (job->downloads) {
        if (job->cancelled.load()) {
            job->downloads->cancel();
        } else {
            job->downloads->wait_idle();
        }
        job->downloads->shutdown();
    }

    std::lock_guard lock(job->mutex);
    auto& result = job->result;
    if (job->fatal.load()) {
        result.state = JobState::FAILED;
    } else if (job->cancelled.load()) {
        result.state = JobState::CANCELLED;
    } else {
        result.state = JobState::COMPLETED;
    }
    result.tables.clear();
    for (const auto& [name, p] : job->progress) result.tables.push_back(p);
    result.finished_at = utils::now();

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        *result.finished_at - result.started_at);
    utils::log::info(std::format("Sync job {} {}: {} tables, {} records processed, {} failed, {} errors in {}ms",
        result.job_id, job_state_to_string(result.state), result.tables.size(),
        result.total_processed(), result.total_failed(), result.errors.size(), elapsed.count()));
    return result;
}

// ============================================================================
// Operations
// ============================================================================

SyncResult SyncOrchestrator::run_full(const RunRequest& request) {
    return run(SyncMode::FULL, request);
}

SyncResult SyncOrchestrator::run_incremental(const RunRequest& request) {
    return run(SyncMode::INCREMENTAL, request);
}

SyncResult SyncOrchestrator::sync_table(const std::string& table, bool full, bool dry_run) {
    RunRequest request;
    request.filter.include = {table};
    request.dry_run = dry_run;
    return run(full ? SyncMode::FULL : SyncMode::INCREMENTAL, request);
}

SyncResult SyncOrchestrator::run(SyncMode mode, const RunRequest& request) {
    auto job = begin_job(mode, request);

    try {
        job->schema = schema();
    } catch (const ConnectionError& e) {
        job->fatal = true;
        job->add_error("", std::nullopt, ErrorCategory::CONNECTION_ERROR, ErrorSeverity::ERROR, e.what());
        return finish_job(job);
    } catch (const SyncError& e) {
        job->fatal = true;
        job->add_error("", std::nullopt, e.category(), ErrorSeverity::ERROR, e.what());
        return finish_job(job);
    }

    for (const auto& name : request.filter.include) {
        if (!job->schema->find_table(name)) {
            job->add_error(name, std::nullopt, ErrorCategory::SCHEMA_ERROR, ErrorSeverity::WARNING,
                "table not found in schema");
        }
    }

    const TableSelector selector(request.filter, options_.default_exclude);
    const auto tables = selector.select(*job->schema);

    job->transformer = std::make_unique<RecordTransformer>(job->schema, options_.transform);

    {
        std::lock_guard lock(job->mutex);
        if (!request.dry_run && ctx_.downloader) {
            job->downloads = std::make_unique<DownloadPool>(ctx_.downloader, options_.download_workers);
        }
        job->result.state = JobState::RUNNING;
        for (const auto& name : tables) {
            auto& p = job->progress[name];
            p.table = name;
        }
    }

    run_tables(*job, *job->schema, tables);
    return finish_job(job);
}

SyncResult SyncOrchestrator::run_schema_discovery() {
    auto job = begin_job(SyncMode::SCHEMA_DISCOVERY, {});
    {
        std::lock_guard lock(job->mutex);
        job->result.state = JobState::RUNNING;
    }

    try {
        job->schema = schema(true);
        for (const auto& t : job->schema->tables) {
            job->update(t.name, [&t](TableProgress& p) {
                p.status = t.has_error() ? CheckpointStatus::FAILED : CheckpointStatus::COMPLETED;
                p.error = t.discovery_error;
            });
            if (t.has_error()) {
                job->add_error(t.name, std::nullopt, ErrorCategory::SCHEMA_ERROR, ErrorSeverity::ERROR,
                    *t.discovery_error);
            }
        }
        if (options_.index_schema_metadata) {
            index_schema_metadata();
        }
    } catch (const CancelledError& e) {
        job->cancelled = true;
        job->add_error("", std::nullopt, ErrorCategory::CANCELLED, ErrorSeverity::WARNING, e.what());
    } catch (const SyncError& e) {
        job->fatal = true;
        job->add_error("", std::nullopt, e.category(), ErrorSeverity::ERROR, e.what());
    }
    return finish_job(job);
}

SyncStatus SyncOrchestrator::status() {
    SyncStatus s;
    s.checkpoints = ctx_.checkpoints.get_all();
    s.tables_monitored = s.checkpoints.size();
    for (const auto& cp : s.checkpoints) {
        s.total_records += cp.rows_processed;
        s.total_failed += cp.rows_failed;
    }

    std::lock_guard lock(job_mutex_);
    if (current_job_) {
        std::lock_guard job_lock(current_job_->mutex);
        if (!is_terminal(current_job_->result.state)) {
            s.current_job_id = current_job_->result.job_id;
            s.current_job_state = current_job_->result.state;
        }
    }
    return s;
}

void SyncOrchestrator::cancel() {
    std::shared_ptr<Job> job;
    DownloadPool* downloads = nullptr;
    {
        std::lock_guard lock(job_mutex_);
        if (!current_job_) return;
        std::lock_guard job_lock(current_job_->mutex);
        if (is_terminal(current_job_->result.state)) return;
        job = current_job_;
        downloads = job->downloads.get();
    }
    utils::log::info(std::format("Cancelling sync job {}", job->result.job_id));
    job->cancelled = true;
    job->stop.request_stop();

    // Outside the locks: dropped records still report to the index from here
    if (downloads) {
        downloads->cancel();
    }
}

void SyncOrchestrator::reset(const std::optional<std::string>& table) {
    {
        std::lock_guard lock(job_mutex_);
        if (current_job_) {
            std::lock_guard job_lock(current_job_->mutex);
            if (!is_terminal(current_job_->result.state)) {
                throw SyncError(ErrorCategory::INTERNAL_ERROR, "cannot reset checkpoints while a sync job is running");
            }
        }
    }
    ctx_.checkpoints.clear(table);
}

size_t SyncOrchestrator::index_schema_metadata() {
    const auto map = schema();
    size_t written = 0;

    for (const auto& t : map->tables) {
        try {
            ctx_.index.upsert(DocumentBuilder::table_metadata_id(t.name),
                DocumentBuilder::table_metadata_fields(*map, t, options_.transform.table_descriptions),
                DocumentKind::SCHEMA_METADATA);
            ++written;
        } catch (const IndexError& e) {
            utils::log::warn(std::format("Failed to index table metadata {}: {}", t.name, e.what()));
        }
    }

    try {
        ctx_.index.upsert(DocumentBuilder::schema_summary_id(map->database_name),
            DocumentBuilder::schema_summary_fields(*map), DocumentKind::SCHEMA_METADATA);
        ++written;
    } catch (const IndexError& e) {
        utils::log::warn(std::format("Failed to index schema summary: {}", e.what()));
    }

    utils::log::info(std::format("Indexed {} schema metadata documents", written));
    return written;
}

// ============================================================================
// Table processing
// ============================================================================

void SyncOrchestrator::run_tables(Job& job, const SchemaMap& schema, const std::vector<std::string>& tables) {
    if (tables.empty()) return;

    std::atomic<size_t> next{0};
    const size_t workers = std::clamp<size_t>(options_.table_workers, 1, tables.size());

    std::vector<std::jthread> threads;
    threads.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        threads.emplace_back([&]() {
            while (!job.stop.stop_requested()) {
                const size_t idx = next.fetch_add(1);
                if (idx >= tables.size()) return;
                if (const auto* table = schema.find_table(tables[idx])) {
                    process_table(job, *table);
                }
            }
        });
    }
    // jthreads join here
}

void SyncOrchestrator::process_table(Job& job, const Table& table) {
    utils::Timer timer;
    utils::log::info(std::format("Table '{}' started ({})", table.name, sync_mode_to_string(job.mode())));
    job.update(table.name, [](TableProgress& p) { p.status = CheckpointStatus::RUNNING; });

    try {
        stream_table(job, table);
    } catch (const ConnectionError& e) {
        // Run-fatal: stop every other table too
        job.fatal = true;
        job.stop.request_stop();
        job.update(table.name, [&e](TableProgress& p) {
            p.status = CheckpointStatus::FAILED;
            p.error = e.what();
        });
        job.add_error(table.name, std::nullopt, ErrorCategory::CONNECTION_ERROR, ErrorSeverity::ERROR, e.what());
        utils::log::error(std::format("Table '{}' lost the source connection: {}", table.name, e.what()));
        return;
    } catch (const CancelledError&) {
        job.update(table.name, [](TableProgress& p) { p.error = "cancelled"; });
        utils::log::info(std::format("Table '{}' interrupted", table.name));
        return;
    } catch (const SyncError& e) {
        job.update(table.name, [&e](TableProgress& p) {
            p.status = CheckpointStatus::FAILED;
            p.error = e.what();
        });
        job.add_error(table.name, std::nullopt, e.category(), ErrorSeverity::ERROR, e.what());
        utils::log::error(std::format("Table '{}' failed: {}", table.name, e.what()));
        return;
    } catch (const std::exception& e) {
        job.update(table.name, [&e](TableProgress& p) {
            p.status = CheckpointStatus::FAILED;
            p.error = e.what();
        });
        job.add_error(table.name, std::nullopt, ErrorCategory::INTERNAL_ERROR, ErrorSeverity::ERROR, e.what());
        utils::log::error(std::format("Table '{}' failed unexpectedly: {}", table.name, e.what()));
        return;
    }

    TableProgress snapshot;
    job.update(table.name, [&snapshot](TableProgress& p) { snapshot = p; });
    utils::log::info(std::format("Table '{}' done: {} processed, {} failed, {} deleted in {}ms",
        table.name, snapshot.rows_processed, snapshot.rows_failed, snapshot.rows_deleted,
        timer.elapsed_ms().count()));
}

void SyncOrchestrator::stream_table(Job& job, const Table& table) {
    if (table.has_error()) {
        throw SchemaError(std::format("discovery failed: {}", *table.discovery_error));
    }
    if (table.primary_key.empty() || !table.find_column(table.primary_key)) {
        throw SchemaError("table has no primary key or id column");
    }

    const bool dry = job.dry_run();
    const auto mode = job.mode();

    const auto existing = ctx_.checkpoints.get(table.name);
    const auto plan = detector_.plan(table, mode, existing);
    if (plan.full_rescan_fallback) {
        job.update(table.name, [](TableProgress& p) { p.full_rescan_fallback = true; });
        job.add_error(table.name, std::nullopt, ErrorCategory::SCHEMA_ERROR, ErrorSeverity::WARNING,
            "no watermark column; incremental sync fell back to a full scan");
    }

    Checkpoint cp(table.name);
    cp.mode = plan.mode;
    cp.status = CheckpointStatus::RUNNING;
    cp.watermark = plan.base_watermark;

    // A full scan runs in id order, so its watermark is only safe to store once every row was read
    const bool id_ordered = !plan.request.watermark_column.has_value();
    std::optional<std::string> observed_watermark = plan.base_watermark;
    if (plan.resuming) {
        cp.last_row_id = existing->last_row_id;
        cp.rows_processed = existing->rows_processed;
        cp.rows_failed = existing->rows_failed;
    }
    if (!dry) ctx_.checkpoints.set(cp);

    const auto reject_row = [&](const std::string& row_id, const char* what) {
        utils::log::warn(std::format("Row {}:{} failed to transform: {}",
            table.name, row_id.empty() ? "<no id>" : row_id, what));
        job.add_error(table.name, row_id.empty() ? std::nullopt : std::optional(row_id),
            ErrorCategory::TRANSFORM_ERROR, ErrorSeverity::ERROR, what);
        cp.last_error = what;
    };

    try {
        const auto wm_column = table.watermark_column();
        auto stream = detector_.open(plan, job.stop.get_token());

        while (auto batch = stream->next_batch()) {
            std::vector<PendingRecord> pending;
            pending.reserve(batch->size());
            int64_t failed = 0;

            // Transform and detect
            for (const auto& row : *batch) {
                const auto row_id = RecordTransformer::row_id_of(table, row);
                if (!row_id.empty()) cp.last_row_id = row_id;
                if (wm_column) {
                    if (const auto raw = row.value(*wm_column)) {
                        observed_watermark = ChangeDetector::advance_watermark(observed_watermark,
                            timestamp::normalize(*raw));
                    }
                }

                try {
                    auto record = job.transformer->transform(table, row);
                    auto detection = FileDetector::detect(table, row, record.source_id);
                    for (const auto& m : detection.malformed) {
                        job.add_error(table.name, record.source_id,
                            ErrorCategory::TRANSFORM_ERROR, ErrorSeverity::WARNING, m);
                    }
                    for (const auto& f : detection.files) {
                        record.file_references.push_back(to_file_reference(f));
                    }
                    pending.push_back(PendingRecord{std::move(record), std::move(detection.files)});
                } catch (const TransformError& e) {
                    ++failed;
                    reject_row(row_id, e.what());
                } catch (const nlohmann::json::exception& e) {
                    ++failed;
                    reject_row(row_id, e.what());
                }
            }

            int64_t files_detected = 0;
            int64_t files_skipped = 0;
            for (auto& p : pending) {
                files_detected += static_cast<int64_t>(p.files.size());
                if (dry) {
                    if (ctx_.downloader) {
                        for (const auto& f : p.files) {
                            if (ctx_.downloader->skip_reason(f)) ++files_skipped;
                        }
                    }
                } else if (!job.downloads) {
                    for (auto& ref : p.record.file_references) {
                        ref.status = DownloadStatus::SKIPPED;
                        ref.reason = "downloads disabled";
                    }
                    files_skipped += static_cast<int64_t>(p.files.size());
                }
            }

            // Index, then retry the rejected records once
            if (!dry) {
                std::vector<PendingRecord*> rejected;
                const auto give_up = [&](PendingRecord& p, const char* what) {
                    p.indexed = false;
                    ++failed;
                    utils::log::error(std::format("Row {}:{} could not be indexed: {}",
                        table.name, p.record.source_id, what));
                    job.add_error(table.name, p.record.source_id,
                        ErrorCategory::INDEX_ERROR, ErrorSeverity::ERROR, what);
                    cp.last_error = what;
                };
                for (auto& p : pending) {
                    try {
                        ctx_.index.upsert(p.record.doc_id, DocumentBuilder::record_fields(p.record));
                    } catch (const IndexError& e) {
                        utils::log::debug(std::format("Upsert of {} rejected, will retry: {}", p.record.doc_id, e.what()));
                        rejected.push_back(&p);
                    } catch (const nlohmann::json::exception& e) {
                        // Not encodable; a retry would fail the same way
                        give_up(p, e.what());
                    }
                }
                for (auto* p : rejected) {
                    try {
                        ctx_.index.upsert(p->record.doc_id, DocumentBuilder::record_fields(p->record));
                    } catch (const IndexError& e) {
                        give_up(*p, e.what());
                    }
                }
            }

            // Downloads for the records that made it into the index
            if (job.downloads) {
                for (auto& p : pending) {
                    if (!p.indexed || p.files.empty()) continue;
                    auto on_complete = [this, &job, table_name = table.name,
                                        source_id = p.record.source_id,
                                        refs = p.record.file_references](
                        const std::string& doc_id, const std::vector<DownloadResult>& results) mutable {
                        apply_download_results(refs, results);
                        int64_t ok = 0, skipped = 0, failed_files = 0;
                        for (const auto& r : results) {
                            if (r.status == DownloadStatus::SUCCESS) ++ok;
                            else if (r.status == DownloadStatus::SKIPPED) ++skipped;
                            else if (r.status == DownloadStatus::FAILED) ++failed_files;
                        }
                        for (const auto& r : results) {
                            if (r.status == DownloadStatus::FAILED) {
                                job.add_error(table_name, source_id, ErrorCategory::DOWNLOAD_ERROR,
                                    ErrorSeverity::WARNING, std::format("{}: {}", r.locator, r.reason));
                            }
                        }
                        try {
                            ctx_.index.update(doc_id, DocumentBuilder::file_references_update(refs));
                        } catch (const IndexError& e) {
                            utils::log::warn(std::format("File status update for {} failed: {}", doc_id, e.what()));
                            job.add_error(table_name, source_id, ErrorCategory::INDEX_ERROR,
                                ErrorSeverity::WARNING, e.what());
                        }
                        job.update(table_name, [&](TableProgress& tp) {
                            tp.files_downloaded += ok;
                            tp.files_skipped += skipped;
                            tp.files_failed += failed_files;
                        });
                    };
                    job.downloads->submit(p.record.doc_id, p.files, std::move(on_complete));
                }
            }

            int64_t processed = 0;
            int64_t rel_skipped = 0;
            for (const auto& p : pending) {
                if (!p.indexed) continue;
                ++processed;
                rel_skipped += static_cast<int64_t>(p.record.relationships_skipped);
            }

            cp.rows_processed += processed;
            cp.rows_failed += failed;
            if (!id_ordered) cp.watermark = observed_watermark;
            job.update(table.name, [&](TableProgress& tp) {
                tp.rows_processed += processed;
                tp.rows_failed += failed;
                tp.relationships_skipped += rel_skipped;
                tp.files_detected += files_detected;
                tp.files_skipped += files_skipped;
                tp.watermark = cp.watermark;
            });

            if (!dry) ctx_.checkpoints.set(cp);

            if (job.stop.stop_requested()) {
                throw CancelledError(std::format("sync of '{}' stopped after a completed batch", table.name));
            }
        }

        int64_t deleted = 0;
        if (mode == SyncMode::INCREMENTAL && options_.reconcile_deletes && !dry) {
            try {
                for (const auto& id : detector_.detect_deletes(table, ctx_.index, options_.delete_sample_size)) {
                    const auto doc_id = make_doc_id(table.name, id);
                    try {
                        ctx_.index.remove(doc_id);
                        ++deleted;
                    } catch (const IndexError& e) {
                        job.add_error(table.name, id, ErrorCategory::INDEX_ERROR, ErrorSeverity::ERROR, e.what());
                    }
                }
            } catch (const IndexError& e) {
                job.add_error(table.name, std::nullopt, ErrorCategory::INDEX_ERROR, ErrorSeverity::WARNING,
                    std::format("delete reconciliation skipped: {}", e.what()));
            }
        }

        cp.status = CheckpointStatus::COMPLETED;
        cp.watermark = observed_watermark;
        cp.last_row_id.reset();
        if (!dry) ctx_.checkpoints.set(cp);

        job.update(table.name, [&](TableProgress& tp) {
            tp.status = CheckpointStatus::COMPLETED;
            tp.rows_deleted += deleted;
            tp.watermark = cp.watermark;
        });
    } catch (const SyncError& e) {
        // Keep the resume position; a cancelled table already has its last batch checkpointed
        const auto category = e.category();
        if (!dry && category != ErrorCategory::CANCELLED && category != ErrorCategory::CHECKPOINT_ERROR) {
            cp.status = CheckpointStatus::FAILED;
            cp.last_error = e.what();
            try {
                ctx_.checkpoints.set(cp);
            } catch (const CheckpointError& ce) {
                utils::log::warn(std::format("Could not record failure of '{}': {}", table.name, ce.what()));
            }
        }
        throw;
    }
}

} // namespace dbsync
