#include <catch2/catch_test_macros.hpp>
#include "sync/sync_orchestrator.hpp"
#include "sync/sqlite_checkpoint_store.hpp"
#include "core/error.hpp"
#include "index/discard_index_sink.hpp"
#include "mocks/fake_index.hpp"
#include "mocks/fake_object_store.hpp"
#include "mocks/gated_object_store.hpp"
#include "mocks/fake_source.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <format>

using namespace dbsync;
using namespace dbsync::testing;
using json = nlohmann::json;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    explicit TmpDir(const std::string& name)
        : path(std::filesystem::temp_directory_path() / ("dbsync_test_" + name)) {
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
};

std::vector<Column> order_columns() {
    return {
        make_column("id", "integer"),
        make_column("project_id", "integer"),
        make_column("title", "text"),
        make_column("updated_at", "timestamp with time zone"),
    };
}

// Source, checkpoints and index wired to one orchestrator
struct Harness {
    TmpDir tmp;
    FakeSourceReader source;
    SqliteCheckpointStore checkpoints;
    FakeIndexSink index;
    std::shared_ptr<FakeObjectStore> storage = std::make_shared<FakeObjectStore>("storage");
    SyncOptions options;

    explicit Harness(const std::string& name)
        : tmp(name), checkpoints((tmp.path / "checkpoints.db").string()) {
        options.table_workers = 2;
        options.batch_size = 2;
    }

    std::shared_ptr<const FileDownloader> downloader() const {
        RetryPolicy retry;
        retry.max_attempts = 1;
        return std::make_shared<const FileDownloader>((tmp.path / "files").string(), DownloadPolicy{}, retry,
            DownloadStrategy::DIRECT_STORAGE, nullptr, storage);
    }

    std::unique_ptr<SyncOrchestrator> make(bool with_downloads = false) {
        SyncContext ctx{source, checkpoints, index, with_downloads ? downloader() : nullptr};
        return std::make_unique<SyncOrchestrator>(std::move(ctx), options);
    }

    void seed_orders(int count) {
        source.add_table("orders", order_columns());
        for (int i = 1; i <= count; ++i) {
            source.upsert_row("orders", {
                {"id", std::to_string(i)},
                {"project_id", "7"},
                {"title", "order " + std::to_string(i)},
                {"updated_at", std::format("2024-05-0{} 10:00:00+00", i)},
            });
        }
    }
};

bool has_error(const SyncResult& result, ErrorCategory category, ErrorSeverity severity) {
    return std::any_of(result.errors.begin(), result.errors.end(), [&](const SyncErrorEntry& e) {
        return e.category == category && e.severity == severity;
    });
}

} // namespace

// ============================================================================
// Full sync
// ============================================================================

TEST_CASE("SyncOrchestrator: full sync indexes every row", "[sync][orchestrator]") {
    Harness h("orch_full");
    h.seed_orders(3);
    auto orch = h.make();

    const auto result = orch->run_full();
    CHECK(result.state == JobState::COMPLETED);
    CHECK(result.total_processed() == 3);
    CHECK(h.index.size() == 3);
    CHECK(h.index.doc("orders:2").at("source_id") == "2");

    const auto cp = h.checkpoints.get("orders");
    REQUIRE(cp.has_value());
    CHECK(cp->status == CheckpointStatus::COMPLETED);
    CHECK(cp->rows_processed == 3);
    CHECK(cp->watermark == "2024-05-03T10:00:00.000000Z");
    CHECK_FALSE(cp->last_row_id.has_value());
}

TEST_CASE("SyncOrchestrator: bad row fails alone", "[sync][orchestrator]") {
    Harness h("orch_bad_row");
    h.seed_orders(3);
    h.source.upsert_row("orders", {{"id", "2"}, {"updated_at", "yesterday"}});
    auto orch = h.make();

    const auto result = orch->run_full();
    CHECK(result.state == JobState::COMPLETED);
    const auto* orders = result.find_table("orders");
    REQUIRE(orders);
    CHECK(orders->status == CheckpointStatus::COMPLETED);
    CHECK(orders->rows_processed == 2);
    CHECK(orders->rows_failed == 1);
    CHECK_FALSE(h.index.contains("orders:2"));

    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].category == ErrorCategory::TRANSFORM_ERROR);
    CHECK(result.errors[0].row_id == "2");
}

TEST_CASE("SyncOrchestrator: repeated full sync leaves the index unchanged", "[sync][orchestrator]") {
    Harness h("orch_idempotent");
    h.seed_orders(4);
    auto orch = h.make();

    REQUIRE(orch->run_full().state == JobState::COMPLETED);
    const auto first = h.index.snapshot();
    REQUIRE(orch->run_full().state == JobState::COMPLETED);
    CHECK(h.index.snapshot() == first);
}

TEST_CASE("SyncOrchestrator: relationships point at referenced documents", "[sync][orchestrator]") {
    Harness h("orch_relationships");
    h.source.add_table("projects", {make_column("id", "integer"), make_column("name", "text")});
    h.source.upsert_row("projects", {{"id", "7"}, {"name", "Apollo"}});
    h.seed_orders(1);
    auto orch = h.make();

    REQUIRE(orch->run_full().state == JobState::COMPLETED);
    const auto doc = h.index.doc("orders:1");
    REQUIRE(doc.at("relationships").size() == 1);
    const auto rel = json::parse(doc.at("relationships")[0].get<std::string>());
    CHECK(rel.at("target_doc_id") == "projects:7");
    CHECK(doc.at("partition_key") == "7");
}

TEST_CASE("SyncOrchestrator: default excludes skip bookkeeping tables", "[sync][orchestrator]") {
    Harness h("orch_excludes");
    h.seed_orders(1);
    h.source.add_table("webhook_deliveries", {make_column("id", "integer")});
    h.source.upsert_row("webhook_deliveries", {{"id", "1"}});
    auto orch = h.make();

    const auto result = orch->run_full();
    CHECK(result.find_table("webhook_deliveries") == nullptr);
    CHECK_FALSE(h.index.contains("webhook_deliveries:1"));
}

TEST_CASE("SyncOrchestrator: unknown included table is a warning", "[sync][orchestrator]") {
    Harness h("orch_unknown_table");
    h.seed_orders(1);
    auto orch = h.make();

    RunRequest request;
    request.filter.include = {"orders", "invoices"};
    const auto result = orch->run_full(request);
    CHECK(result.state == JobState::COMPLETED);
    CHECK(result.total_processed() == 1);
    CHECK(has_error(result, ErrorCategory::SCHEMA_ERROR, ErrorSeverity::WARNING));
}

// ============================================================================
// Incremental sync
// ============================================================================

TEST_CASE("SyncOrchestrator: incremental sync picks up only changed rows", "[sync][orchestrator][incremental]") {
    Harness h("orch_incremental");
    h.seed_orders(3);
    auto orch = h.make();

    REQUIRE(orch->run_incremental().total_processed() == 3);

    h.source.upsert_row("orders", {{"id", "2"}, {"title", "renamed"}, {"updated_at", "2024-06-01 00:00:00+00"}});
    const auto second = orch->run_incremental();
    CHECK(second.total_processed() == 1);
    CHECK(h.index.doc("orders:2").at("content_text") == "renamed");
    CHECK(h.checkpoints.get("orders")->watermark == "2024-06-01T00:00:00.000000Z");

    CHECK(orch->run_incremental().total_processed() == 0);
}

TEST_CASE("SyncOrchestrator: table without watermark falls back to a full scan", "[sync][orchestrator][incremental]") {
    Harness h("orch_fallback");
    h.source.add_table("tags", {make_column("id", "integer"), make_column("label", "text")});
    h.source.upsert_row("tags", {{"id", "1"}, {"label", "urgent"}});
    auto orch = h.make();

    const auto result = orch->run_incremental();
    const auto* tags = result.find_table("tags");
    REQUIRE(tags);
    CHECK(tags->full_rescan_fallback);
    CHECK(tags->rows_processed == 1);
    CHECK(has_error(result, ErrorCategory::SCHEMA_ERROR, ErrorSeverity::WARNING));
}

TEST_CASE("SyncOrchestrator: deleted rows are removed from the index", "[sync][orchestrator][deletes]") {
    Harness h("orch_deletes");
    h.options.reconcile_deletes = true;
    h.seed_orders(3);
    auto orch = h.make();

    REQUIRE(orch->run_full().state == JobState::COMPLETED);
    h.source.delete_row("orders", "2");

    const auto result = orch->run_incremental();
    CHECK(result.find_table("orders")->rows_deleted == 1);
    CHECK_FALSE(h.index.contains("orders:2"));
    CHECK(h.index.removed() == std::set<std::string>{"orders:2"});
}

// ============================================================================
// Cancellation and resume
// ============================================================================

TEST_CASE("SyncOrchestrator: cancelled run resumes after the last batch", "[sync][orchestrator][resume]") {
    Harness h("orch_resume");
    h.options.table_workers = 1;
    h.seed_orders(5);
    auto orch = h.make();

    h.source.on_batch([&orch](const std::string&, size_t batch) {
        if (batch == 0) orch->cancel();
    });
    const auto cancelled = orch->run_full();
    CHECK(cancelled.state == JobState::CANCELLED);
    CHECK(cancelled.find_table("orders")->error == "cancelled");

    auto cp = h.checkpoints.get("orders");
    REQUIRE(cp.has_value());
    CHECK(cp->status == CheckpointStatus::RUNNING);
    CHECK(cp->last_row_id == "2");
    CHECK(cp->rows_processed == 2);
    CHECK(h.index.size() == 2);

    h.source.on_batch(nullptr);
    const auto resumed = orch->run_full();
    CHECK(resumed.state == JobState::COMPLETED);
    CHECK(resumed.total_processed() == 3);
    CHECK(h.index.size() == 5);

    cp = h.checkpoints.get("orders");
    CHECK(cp->status == CheckpointStatus::COMPLETED);
    CHECK(cp->rows_processed == 5);
}

TEST_CASE("SyncOrchestrator: interrupted full scan is finished by the next incremental run", "[sync][orchestrator][resume]") {
    Harness h("orch_full_then_incremental");
    h.options.table_workers = 1;
    h.source.add_table("orders", order_columns());
    // Ids ascend while watermarks descend
    for (int i = 1; i <= 5; ++i) {
        h.source.upsert_row("orders", {
            {"id", std::to_string(i)},
            {"project_id", "7"},
            {"title", "order " + std::to_string(i)},
            {"updated_at", std::format("2024-05-0{} 10:00:00+00", 6 - i)},
        });
    }
    auto orch = h.make();

    h.source.on_batch([&orch](const std::string&, size_t batch) {
        if (batch == 0) orch->cancel();
    });
    REQUIRE(orch->run_full().state == JobState::CANCELLED);

    auto cp = h.checkpoints.get("orders");
    REQUIRE(cp.has_value());
    CHECK(cp->status == CheckpointStatus::RUNNING);
    CHECK(cp->last_row_id == "2");
    CHECK_FALSE(cp->watermark.has_value());
    CHECK(h.index.size() == 2);

    h.source.on_batch(nullptr);
    const auto resumed = orch->run_incremental();
    CHECK(resumed.state == JobState::COMPLETED);
    CHECK(resumed.total_processed() == 3);
    CHECK(h.index.size() == 5);

    cp = h.checkpoints.get("orders");
    CHECK(cp->status == CheckpointStatus::COMPLETED);
    CHECK(cp->mode == SyncMode::FULL);
    CHECK(cp->watermark.has_value());
}

TEST_CASE("SyncOrchestrator: second job and reset are refused while running", "[sync][orchestrator]") {
    Harness h("orch_busy");
    h.options.table_workers = 1;
    h.seed_orders(3);
    auto orch = h.make();

    std::atomic<bool> run_refused{false};
    std::atomic<bool> reset_refused{false};
    std::atomic<bool> status_running{false};
    h.source.on_batch([&](const std::string&, size_t batch) {
        if (batch != 0) return;
        try {
            (void)orch->run_incremental();
        } catch (const SyncError&) {
            run_refused = true;
        }
        try {
            orch->reset();
        } catch (const SyncError&) {
            reset_refused = true;
        }
        status_running = orch->status().current_job_state == JobState::RUNNING;
    });

    CHECK(orch->run_full().state == JobState::COMPLETED);
    CHECK(run_refused.load());
    CHECK(reset_refused.load());
    CHECK(status_running.load());

    // Idle again
    CHECK_FALSE(orch->status().current_job_id.has_value());
    orch->reset("orders");
    CHECK_FALSE(h.checkpoints.get("orders").has_value());
}

// ============================================================================
// Failures
// ============================================================================

TEST_CASE("SyncOrchestrator: lost source connection fails the job", "[sync][orchestrator][errors]") {
    Harness h("orch_connection");
    h.seed_orders(2);
    h.source.fail_scans_for("orders");
    auto orch = h.make();

    const auto result = orch->run_full();
    CHECK(result.state == JobState::FAILED);
    CHECK(has_error(result, ErrorCategory::CONNECTION_ERROR, ErrorSeverity::ERROR));
    CHECK(h.checkpoints.get("orders")->status == CheckpointStatus::FAILED);
}

TEST_CASE("SyncOrchestrator: unreachable source fails before any table", "[sync][orchestrator][errors]") {
    Harness h("orch_unreachable");
    h.seed_orders(2);
    h.source.set_unreachable(true);
    auto orch = h.make();

    const auto result = orch->run_full();
    CHECK(result.state == JobState::FAILED);
    CHECK(result.tables.empty());
    CHECK(has_error(result, ErrorCategory::CONNECTION_ERROR, ErrorSeverity::ERROR));
}

TEST_CASE("SyncOrchestrator: rejected upsert is retried once", "[sync][orchestrator][errors]") {
    Harness h("orch_index_retry");
    h.seed_orders(3);
    h.index.reject("orders:1", 1);
    h.index.reject("orders:3", 2);
    auto orch = h.make();

    const auto result = orch->run_full();
    const auto* orders = result.find_table("orders");
    REQUIRE(orders);
    CHECK(orders->rows_processed == 2);
    CHECK(orders->rows_failed == 1);
    CHECK(h.index.contains("orders:1"));
    CHECK_FALSE(h.index.contains("orders:3"));
    CHECK(has_error(result, ErrorCategory::INDEX_ERROR, ErrorSeverity::ERROR));
}

TEST_CASE("SyncOrchestrator: row with invalid UTF-8 does not fail its table", "[sync][orchestrator][errors]") {
    Harness h("orch_invalid_utf8");
    h.source.add_table("notes", {
        make_column("id", "integer"),
        make_column("title", "text"),
        make_column("labels", "ARRAY", "_text"),
    });
    h.source.upsert_row("notes", {{"id", "1"}, {"title", "plain"}, {"labels", "{a,b}"}});
    h.source.upsert_row("notes", {{"id", "2"}, {"title", "caf\xe9"}, {"labels", "{\"caf\xe9\"}"}});
    h.source.upsert_row("notes", {{"id", "3"}, {"title", "last"}, {"labels", "{c}"}});
    auto orch = h.make();

    const auto result = orch->run_full();
    const auto* notes = result.find_table("notes");
    REQUIRE(notes);
    CHECK(notes->status == CheckpointStatus::COMPLETED);
    CHECK(notes->rows_processed == 3);
    CHECK(notes->rows_failed == 0);
    CHECK(h.index.doc("notes:2").at("metadata").at("labels") == "[\"caf\xEF\xBF\xBD\"]");
    CHECK(h.index.contains("notes:3"));
}

// ============================================================================
// Dry run
// ============================================================================

TEST_CASE("SyncOrchestrator: dry run counts rows and writes nothing", "[sync][orchestrator][dry-run]") {
    Harness h("orch_dry_run");
    h.seed_orders(3);
    auto orch = h.make(true);

    RunRequest request;
    request.dry_run = true;
    const auto result = orch->run_full(request);
    CHECK(result.dry_run);
    CHECK(result.state == JobState::COMPLETED);
    CHECK(result.total_processed() == 3);
    CHECK(h.index.upsert_count() == 0);
    CHECK(h.checkpoints.get_all().empty());
    CHECK(h.storage->fetch_count() == 0);
}

TEST_CASE("SyncOrchestrator: dry run works against a discarding index", "[sync][orchestrator][dry-run]") {
    Harness h("orch_dry_run_discard");
    h.seed_orders(3);
    DiscardIndexSink discard;
    SyncOrchestrator orch(SyncContext{h.source, h.checkpoints, discard, nullptr}, h.options);

    RunRequest request;
    request.dry_run = true;
    const auto result = orch.run_incremental(request);
    CHECK(result.state == JobState::COMPLETED);
    CHECK(result.total_processed() == 3);
    CHECK(discard.writes_dropped() == 0);
    CHECK(orch.status().tables_monitored == 0);
}

// ============================================================================
// Files
// ============================================================================

TEST_CASE("SyncOrchestrator: key map column downloads every file", "[sync][orchestrator][files]") {
    Harness h("orch_key_map");
    h.source.add_table("documents", {make_column("id", "integer"), make_column("attachments_s3_keys", "jsonb")});
    h.source.upsert_row("documents", {
        {"id", "1"},
        {"attachments_s3_keys", R"({"f1": "co/1/a.pdf", "f2": "co/1/b.png"})"},
    });
    h.storage->put("co/1/a.pdf", "%PDF");
    h.storage->put("co/1/b.png", "PNG");
    auto orch = h.make(true);

    const auto result = orch->run_full();
    const auto* documents = result.find_table("documents");
    REQUIRE(documents);
    CHECK(documents->files_detected == 2);
    CHECK(documents->files_downloaded == 2);

    const auto refs = h.index.doc("documents:1").at("file_references");
    REQUIRE(refs.size() == 2);
    const auto first = json::parse(refs[0].get<std::string>());
    CHECK(first.at("map_key") == "f1");
    CHECK(first.at("status") == "success");
    CHECK(std::filesystem::exists(first.at("local_path").get<std::string>()));
}

TEST_CASE("SyncOrchestrator: status answers while cancel drops queued downloads", "[sync][orchestrator][files]") {
    Harness h("orch_cancel_downloads");
    h.options.table_workers = 1;
    h.options.download_workers = 1;
    h.source.add_table("documents", {make_column("id", "integer"), make_column("cover_s3_key", "text")});
    for (int i = 1; i <= 3; ++i) {
        h.source.upsert_row("documents", {
            {"id", std::to_string(i)},
            {"cover_s3_key", std::format("co/{}/cover.pdf", i)},
        });
    }

    // The first fetch holds the only worker, so row 2 is still queued when cancel runs
    auto gated = std::make_shared<GatedObjectStore>();
    RetryPolicy retry;
    retry.max_attempts = 1;
    auto downloader = std::make_shared<const FileDownloader>((h.tmp.path / "files").string(),
        DownloadPolicy{}, retry, DownloadStrategy::DIRECT_STORAGE, nullptr, gated);
    SyncOrchestrator orch(SyncContext{h.source, h.checkpoints, h.index, downloader}, h.options);

    std::atomic<bool> status_during_cancel{false};
    h.index.on_update([&](const std::string& doc_id) {
        if (doc_id == "documents:2") {
            status_during_cancel = orch.status().current_job_state == JobState::RUNNING;
        }
    });
    h.source.on_batch([&](const std::string&, size_t batch) {
        if (batch != 1) return;
        gated->wait_entered();
        orch.cancel();
        gated->release();
    });

    const auto result = orch.run_full();
    CHECK(result.state == JobState::CANCELLED);
    CHECK(status_during_cancel.load());

    const auto ref = json::parse(h.index.doc("documents:2").at("file_references")[0].get<std::string>());
    CHECK(ref.at("status") == "skipped");
    CHECK(ref.at("reason") == "cancelled");
}

TEST_CASE("SyncOrchestrator: unsupported file type is skipped", "[sync][orchestrator][files]") {
    Harness h("orch_unsupported");
    h.source.add_table("documents", {make_column("id", "integer"), make_column("cover_s3_key", "text")});
    h.source.upsert_row("documents", {{"id", "1"}, {"cover_s3_key", "co/1/notes.docx"}});
    h.storage->put("co/1/notes.docx", "DOCX");
    auto orch = h.make(true);

    const auto result = orch->run_full();
    CHECK(result.find_table("documents")->files_skipped == 1);
    CHECK(h.storage->fetch_count() == 0);

    const auto ref = json::parse(h.index.doc("documents:1").at("file_references")[0].get<std::string>());
    CHECK(ref.at("status") == "skipped");
}

TEST_CASE("SyncOrchestrator: downloads disabled marks files skipped", "[sync][orchestrator][files]") {
    Harness h("orch_no_downloads");
    h.source.add_table("documents", {make_column("id", "integer"), make_column("cover_s3_key", "text")});
    h.source.upsert_row("documents", {{"id", "1"}, {"cover_s3_key", "co/1/cover.pdf"}});
    auto orch = h.make(false);

    const auto result = orch->run_full();
    CHECK(result.find_table("documents")->files_skipped == 1);
    const auto ref = json::parse(h.index.doc("documents:1").at("file_references")[0].get<std::string>());
    CHECK(ref.at("reason") == "downloads disabled");
}

// ============================================================================
// Schema
// ============================================================================

TEST_CASE("SyncOrchestrator: schema discovery indexes metadata documents", "[sync][orchestrator][schema]") {
    Harness h("orch_schema");
    h.options.index_schema_metadata = true;
    h.options.schema_cache_path = (h.tmp.path / "schema.json").string();
    h.source.add_table("projects", {make_column("id", "integer")});
    h.seed_orders(1);
    auto orch = h.make();

    const auto result = orch->run_schema_discovery();
    CHECK(result.state == JobState::COMPLETED);
    CHECK(result.mode == SyncMode::SCHEMA_DISCOVERY);
    CHECK(h.index.metadata_count() == 3);
    CHECK(h.index.metadata_doc("table:orders").at("metadata_type") == "table");
    CHECK(h.index.metadata_doc("schema:appdb").at("metadata_type") == "full_schema");
    CHECK(std::filesystem::exists(h.options.schema_cache_path));
    CHECK(h.index.size() == 0);
}

TEST_CASE("SyncOrchestrator: cached schema skips introspection", "[sync][orchestrator][schema]") {
    Harness h("orch_schema_cache");
    h.options.schema_cache_path = (h.tmp.path / "schema.json").string();
    h.seed_orders(1);
    (void)h.make()->schema();

    h.source.set_unreachable(true);
    auto orch = h.make();
    CHECK(orch->schema()->find_table("orders") != nullptr);
    CHECK_THROWS_AS(orch->schema(true), ConnectionError);
}

TEST_CASE("SyncOrchestrator: status sums checkpoints", "[sync][orchestrator]") {
    Harness h("orch_status");
    h.seed_orders(3);
    h.source.add_table("projects", {make_column("id", "integer")});
    h.source.upsert_row("projects", {{"id", "7"}});
    auto orch = h.make();

    REQUIRE(orch->run_full().state == JobState::COMPLETED);
    const auto s = orch->status();
    CHECK(s.tables_monitored == 2);
    CHECK(s.total_records == 4);
    CHECK(s.total_failed == 0);
}
