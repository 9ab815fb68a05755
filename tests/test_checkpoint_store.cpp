#include <catch2/catch_test_macros.hpp>
#include "sync/sqlite_checkpoint_store.hpp"
#include "core/error.hpp"

#include <filesystem>
#include <fstream>
#include <thread>

using namespace dbsync;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "dbsync_test_checkpoints") {
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
    std::string db() const { return (path / "state" / "checkpoints.db").string(); }
};

Checkpoint running_checkpoint(const std::string& table) {
    Checkpoint cp(table);
    cp.mode = SyncMode::INCREMENTAL;
    cp.status = CheckpointStatus::RUNNING;
    cp.watermark = "2024-05-01T12:00:00.000000Z";
    cp.last_row_id = "120";
    cp.rows_processed = 120;
    cp.rows_failed = 2;
    return cp;
}

} // namespace

TEST_CASE("CheckpointStore: unknown table has no checkpoint", "[checkpoint]") {
    TmpDir tmp;
    SqliteCheckpointStore store(tmp.db());
    CHECK_FALSE(store.get("orders").has_value());
    CHECK(store.get_all().empty());
    CHECK(std::filesystem::exists(tmp.db()));
}

TEST_CASE("CheckpointStore: set then get returns every field", "[checkpoint]") {
    TmpDir tmp;
    SqliteCheckpointStore store(tmp.db());

    auto cp = running_checkpoint("orders");
    cp.last_error = "connection reset";
    store.set(cp);

    const auto loaded = store.get("orders");
    REQUIRE(loaded);
    CHECK(loaded->table == "orders");
    CHECK(loaded->mode == SyncMode::INCREMENTAL);
    CHECK(loaded->status == CheckpointStatus::RUNNING);
    CHECK(loaded->watermark == "2024-05-01T12:00:00.000000Z");
    CHECK(loaded->last_row_id == "120");
    CHECK(loaded->rows_processed == 120);
    CHECK(loaded->rows_failed == 2);
    CHECK(loaded->last_error == "connection reset");
    CHECK(loaded->updated_at.time_since_epoch().count() > 0);
}

TEST_CASE("CheckpointStore: set replaces the previous checkpoint", "[checkpoint]") {
    TmpDir tmp;
    SqliteCheckpointStore store(tmp.db());
    store.set(running_checkpoint("orders"));

    Checkpoint done("orders");
    done.mode = SyncMode::INCREMENTAL;
    done.status = CheckpointStatus::COMPLETED;
    done.watermark = "2024-05-02T00:00:00.000000Z";
    done.rows_processed = 300;
    store.set(done);

    const auto loaded = store.get("orders");
    REQUIRE(loaded);
    CHECK(loaded->status == CheckpointStatus::COMPLETED);
    CHECK_FALSE(loaded->last_row_id.has_value());
    CHECK_FALSE(loaded->last_error.has_value());
    CHECK(store.get_all().size() == 1);
}

TEST_CASE("CheckpointStore: checkpoints survive reopening", "[checkpoint]") {
    TmpDir tmp;
    {
        SqliteCheckpointStore store(tmp.db());
        store.set(running_checkpoint("orders"));
    }
    SqliteCheckpointStore reopened(tmp.db());
    const auto loaded = reopened.get("orders");
    REQUIRE(loaded);
    CHECK(loaded->last_row_id == "120");
}

TEST_CASE("CheckpointStore: get_all is sorted and clear removes one or all", "[checkpoint]") {
    TmpDir tmp;
    SqliteCheckpointStore store(tmp.db());
    store.set(running_checkpoint("projects"));
    store.set(running_checkpoint("invoices"));
    store.set(running_checkpoint("orders"));

    auto all = store.get_all();
    REQUIRE(all.size() == 3);
    CHECK(all[0].table == "invoices");
    CHECK(all[1].table == "orders");
    CHECK(all[2].table == "projects");

    store.clear("orders");
    CHECK_FALSE(store.get("orders").has_value());
    CHECK(store.get_all().size() == 2);

    store.clear();
    CHECK(store.get_all().empty());
}

TEST_CASE("CheckpointStore: concurrent writers on different tables", "[checkpoint]") {
    TmpDir tmp;
    SqliteCheckpointStore store(tmp.db());

    std::vector<std::jthread> writers;
    for (int w = 0; w < 4; ++w) {
        writers.emplace_back([&store, w] {
            for (int i = 1; i <= 10; ++i) {
                auto cp = running_checkpoint("table_" + std::to_string(w));
                cp.rows_processed = i;
                store.set(cp);
            }
        });
    }
    writers.clear();

    const auto all = store.get_all();
    REQUIRE(all.size() == 4);
    for (const auto& cp : all) CHECK(cp.rows_processed == 10);
}

TEST_CASE("CheckpointStore: unusable location is a CheckpointError", "[checkpoint]") {
    TmpDir tmp;
    const auto blocker = tmp.file("blocker", "not a directory");
    CHECK_THROWS_AS(SqliteCheckpointStore(blocker + "/checkpoints.db"), CheckpointError);
}
