#include <catch2/catch_test_macros.hpp>
#include "db/connection_manager.hpp"
#include "db/source_connection_pool.hpp"
#include "core/error.hpp"
#include "mocks/fake_db_connection.hpp"

using namespace dbsync;
using namespace dbsync::testing;
using namespace std::chrono_literals;

namespace {

RetryPolicy fast_retry(int attempts = 3) {
    RetryPolicy r;
    r.max_attempts = attempts;
    r.initial_backoff = 1ms;
    r.max_backoff = 2ms;
    return r;
}

struct Harness {
    std::shared_ptr<FakeDatabase> db = std::make_shared<FakeDatabase>();
    std::shared_ptr<FakeConnectionFactory> factory = std::make_shared<FakeConnectionFactory>(db);
    std::shared_ptr<ConnectionManager> manager;

    explicit Harness(int attempts = 3, size_t min_connections = 0) {
        PoolConfig config;
        config.min_connections = min_connections;
        config.max_connections = 2;
        auto pool = std::make_shared<SourceConnectionPool>("source", config, factory);
        manager = std::make_shared<ConnectionManager>(pool, fast_retry(attempts), 20ms);
    }
};

// FETCH answers: `batches` full batches of `size` rows, then an empty result
FakeDatabase::Handler cursor_script(int batches, size_t size) {
    auto served = std::make_shared<int>(0);
    return [served, batches, size](const std::string& sql, const std::vector<DbValue>&) {
        if (!sql.starts_with("FETCH")) return ok_command();
        std::vector<DbRow> rows;
        if (*served < batches) {
            for (size_t i = 0; i < size; ++i) {
                rows.push_back({std::to_string(*served * static_cast<int>(size) + static_cast<int>(i) + 1)});
            }
            ++*served;
        }
        return ok_rows({"id"}, std::move(rows));
    };
}

} // namespace

TEST_CASE("ConnectionManager: connection failures are retried", "[connection]") {
    Harness h;
    h.factory->refuse_next(2);
    h.db->handler = [](const std::string&, const std::vector<DbValue>&) {
        return ok_rows({"n"}, {{"1"}});
    };

    const auto rs = h.manager->query("SELECT 1");
    CHECK(rs.success);
    CHECK(h.factory->attempts() == 3);
}

TEST_CASE("ConnectionManager: exhausted retries raise ConnectionError", "[connection]") {
    Harness h(3);
    h.factory->refuse_next(100);

    CHECK_THROWS_AS(h.manager->query("SELECT 1"), ConnectionError);
    CHECK(h.factory->attempts() == 3);
}

TEST_CASE("ConnectionManager: query errors surface without retry", "[connection]") {
    Harness h;
    h.db->handler = [](const std::string&, const std::vector<DbValue>&) {
        return DbResultSet::failure("relation \"nope\" does not exist");
    };

    CHECK_THROWS_AS(h.manager->query("SELECT * FROM nope"), QueryError);
    CHECK(h.db->log().size() == 1);
}

TEST_CASE("ConnectionManager: lost connection mid-query is retried on a fresh one", "[connection]") {
    Harness h;
    auto calls = std::make_shared<int>(0);
    h.db->handler = [calls](const std::string&, const std::vector<DbValue>&) {
        if ((*calls)++ == 0) return DbResultSet::failure("terminating connection", true);
        return ok_rows({"n"}, {{"1"}});
    };

    const auto rs = h.manager->query("SELECT 1");
    CHECK(rs.success);
    CHECK(h.factory->total_created() == 2);
}

TEST_CASE("ConnectionManager: parameters reach the connection", "[connection]") {
    Harness h;
    (void)h.manager->query("SELECT $1::text", {std::string("public")});

    std::lock_guard lock(h.db->mutex);
    REQUIRE(h.db->parameters.size() == 1);
    REQUIRE(h.db->parameters[0].size() == 1);
    CHECK(h.db->parameters[0][0] == "public");
}

TEST_CASE("RowCursor: reads in batches inside a read-only transaction", "[connection][cursor]") {
    Harness h;
    h.db->handler = cursor_script(2, 3);

    auto cursor = h.manager->open_cursor("SELECT id FROM t ORDER BY id", {}, 3);
    size_t total = 0;
    int batches = 0;
    while (auto batch = cursor->next_batch()) {
        total += batch->rows.size();
        ++batches;
    }
    cursor->close();

    CHECK(total == 6);
    CHECK(batches == 2);
    const auto log = h.db->log();
    REQUIRE(log.size() >= 4);
    CHECK(log[0] == "BEGIN READ ONLY");
    CHECK(log[1].starts_with("DECLARE dbsync_cursor_"));
    CHECK(log[1].find("NO SCROLL CURSOR FOR SELECT id FROM t ORDER BY id") != std::string::npos);
    CHECK(log[2].starts_with("FETCH FORWARD 3 FROM dbsync_cursor_"));
    CHECK(log.back() == "ROLLBACK");
}

TEST_CASE("RowCursor: short batch ends the cursor without another fetch", "[connection][cursor]") {
    Harness h;
    h.db->handler = [](const std::string& sql, const std::vector<DbValue>&) {
        if (sql.starts_with("FETCH")) return ok_rows({"id"}, {{"1"}, {"2"}});
        return ok_command();
    };

    auto cursor = h.manager->open_cursor("SELECT id FROM t", {}, 5);
    auto first = cursor->next_batch();
    REQUIRE(first);
    CHECK(first->rows.size() == 2);
    CHECK(cursor->exhausted());
    CHECK_FALSE(cursor->next_batch().has_value());

    size_t fetches = 0;
    for (const auto& s : h.db->log()) {
        if (s.starts_with("FETCH")) ++fetches;
    }
    CHECK(fetches == 1);
}

TEST_CASE("RowCursor: stop request cancels the running statement", "[connection][cursor]") {
    Harness h;
    h.db->handler = cursor_script(5, 2);

    std::stop_source stop;
    auto cursor = h.manager->open_cursor("SELECT id FROM t", {}, 2, stop.get_token());
    REQUIRE(cursor->next_batch());

    stop.request_stop();
    CHECK(h.db->cancels.load() == 1);
    CHECK_THROWS_AS(cursor->next_batch(), CancelledError);
}

TEST_CASE("RowCursor: rejected DECLARE is a QueryError and the transaction is closed", "[connection][cursor]") {
    Harness h(3, 1);
    h.db->handler = [](const std::string& sql, const std::vector<DbValue>&) {
        if (sql.starts_with("DECLARE")) return DbResultSet::failure("column \"x\" does not exist");
        return ok_command();
    };

    CHECK_THROWS_AS(h.manager->open_cursor("SELECT x FROM t", {}, 10), QueryError);
    CHECK(h.db->sent("ROLLBACK"));
}
