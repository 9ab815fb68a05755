#pragma once

#include "db/idb_connection.hpp"
#include "db/pooled_connection.hpp"
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace dbsync {

/**
 * @brief Server-side, forward-only cursor over one pooled connection
 *
 * Opens a READ ONLY transaction, DECLAREs a NO SCROLL cursor and FETCHes
 * batch_size rows per call, so memory stays bounded by the batch size.
 * The sequence is finite and not restartable.
 *
 * A stop request on the token cancels the statement running on the
 * server; the pending next_batch() then throws CancelledError.
 */
class RowCursor {
public:
    /**
     * @brief Open a cursor on an already-acquired connection
     * @throws ConnectionError if the connection dropped, QueryError if the
     *         statement was rejected, CancelledError on stop
     */
    static std::unique_ptr<RowCursor> open(
        std::unique_ptr<PooledConnection> conn,
        const std::string& sql,
        const std::vector<DbValue>& params,
        size_t batch_size,
        std::stop_token st = {});

    ~RowCursor();

    RowCursor(const RowCursor&) = delete;
    RowCursor& operator=(const RowCursor&) = delete;

    /**
     * @brief Fetch the next batch
     * @return Rows (never empty), or nullopt once the cursor is exhausted
     */
    [[nodiscard]] std::optional<DbResultSet> next_batch();

    [[nodiscard]] bool exhausted() const { return exhausted_; }

    /**
     * @brief Close the cursor and end the transaction; idempotent
     */
    void close();

private:
    struct CancelQuery {
        IDbConnection* conn;
        void operator()() const noexcept { conn->cancel(); }
    };

    RowCursor(std::unique_ptr<PooledConnection> conn, std::string name,
              size_t batch_size, std::stop_token st);

    std::unique_ptr<PooledConnection> conn_;
    std::string name_;
    size_t batch_size_;
    std::stop_token stop_;
    bool in_transaction_ = false;
    bool exhausted_ = false;

    // Declared after conn_ so it is destroyed first
    std::optional<std::stop_callback<CancelQuery>> on_stop_;
};

/**
 * @brief Convert a failed DbResultSet into the matching exception
 *
 * CancelledError when the stop token fired, ConnectionError when the
 * connection was lost, QueryError otherwise.
 */
[[noreturn]] void throw_query_failure(const DbResultSet& result, const std::string& context,
                                      const std::stop_token& st = {});

} // namespace dbsync
