#include "db/row_cursor.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <atomic>
#include <format>

namespace dbsync {

namespace {

std::string next_cursor_name() {
    static std::atomic<uint64_t> counter{0};
    return std::format("dbsync_cursor_{}", counter.fetch_add(1, std::memory_order_relaxed));
}

} // namespace

void throw_query_failure(const DbResultSet& result, const std::string& context,
                         const std::stop_token& st) {
    if (st.stop_requested()) {
        throw CancelledError(std::format("{}: cancelled", context));
    }
    if (result.connection_lost) {
        throw ConnectionError(std::format("{}: {}", context, result.error_message));
    }
    throw QueryError(std::format("{}: {}", context, result.error_message));
}

RowCursor::RowCursor(std::unique_ptr<PooledConnection> conn, std::string name,
                     size_t batch_size, std::stop_token st)
    : conn_(std::move(conn)),
      name_(std::move(name)),
      batch_size_(batch_size == 0 ? 1 : batch_size),
      stop_(std::move(st)) {}

std::unique_ptr<RowCursor> RowCursor::open(
    std::unique_ptr<PooledConnection> conn,
    const std::string& sql,
    const std::vector<DbValue>& params,
    size_t batch_size,
    std::stop_token st) {

    std::unique_ptr<RowCursor> cursor(
        new RowCursor(std::move(conn), next_cursor_name(), batch_size, st));
    IDbConnection* db = cursor->conn_->get();

    const auto begin = db->execute("BEGIN READ ONLY");
    if (!begin.success) {
        cursor->conn_->mark_broken();
        throw_query_failure(begin, "BEGIN", st);
    }
    cursor->in_transaction_ = true;

    cursor->on_stop_.emplace(st, CancelQuery{db});

    const auto declared = db->execute(
        std::format("DECLARE {} NO SCROLL CURSOR FOR {}", cursor->name_, sql), params);
    if (!declared.success) {
        if (declared.connection_lost) cursor->conn_->mark_broken();
        throw_query_failure(declared, "DECLARE CURSOR", st);
    }

    return cursor;
}

RowCursor::~RowCursor() {
    close();
}

std::optional<DbResultSet> RowCursor::next_batch() {
    if (exhausted_ || !conn_) {
        return std::nullopt;
    }
    if (stop_.stop_requested()) {
        throw CancelledError("cursor fetch cancelled");
    }

    auto result = conn_->get()->execute(
        std::format("FETCH FORWARD {} FROM {}", batch_size_, name_));
    if (!result.success) {
        exhausted_ = true;
        if (result.connection_lost) conn_->mark_broken();
        throw_query_failure(result, "FETCH", stop_);
    }

    if (result.rows.size() < batch_size_) {
        exhausted_ = true;
    }
    if (result.rows.empty()) {
        return std::nullopt;
    }
    return result;
}

void RowCursor::close() {
    on_stop_.reset();
    if (!conn_) {
        return;
    }
    if (in_transaction_) {
        // ROLLBACK also releases the cursor and is valid after an aborted statement
        const auto end = conn_->get()->execute("ROLLBACK");
        if (!end.success) {
            utils::log::debug(std::format("ROLLBACK of cursor {} failed: {}", name_, end.error_message));
            conn_->mark_broken();
        }
        in_transaction_ = false;
    }
    exhausted_ = true;
    conn_.reset();
}

} // namespace dbsync
