#pragma once

#include "core/retry_policy.hpp"
#include "db/source_connection_pool.hpp"
#include "db/pooled_connection.hpp"
#include "db/row_cursor.hpp"
#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace dbsync {

/**
 * @brief Single gateway to the source database
 *
 * Owns the retry policy for connectivity failures. Only ConnectionError
 * is retried; a QueryError means the connection is fine and the statement
 * is at fault, so it surfaces immediately. When retries are exhausted the
 * ConnectionError propagates and the caller treats it as run-fatal.
 */
class ConnectionManager {
public:
    ConnectionManager(std::shared_ptr<IConnectionPool> pool,
                      RetryPolicy retry,
                      std::chrono::milliseconds acquire_timeout = std::chrono::milliseconds{5000});

    /**
     * @brief Lease a connection, retrying with backoff
     * @throws ConnectionError when no connection could be obtained
     */
    [[nodiscard]] std::unique_ptr<PooledConnection> acquire(std::stop_token st = {});

    /**
     * @brief Run a small query (catalog lookups, id probes) to completion
     * @throws ConnectionError, QueryError, CancelledError
     */
    [[nodiscard]] DbResultSet query(const std::string& sql,
                                    const std::vector<DbValue>& params = {},
                                    std::stop_token st = {});

    /**
     * @brief Open a batched cursor; opening is retried, fetching is not
     * @throws ConnectionError, QueryError, CancelledError
     */
    [[nodiscard]] std::unique_ptr<RowCursor> open_cursor(const std::string& sql,
                                                         const std::vector<DbValue>& params,
                                                         size_t batch_size,
                                                         std::stop_token st = {});

    [[nodiscard]] const RetryPolicy& retry_policy() const { return retry_; }

    [[nodiscard]] PoolStats pool_stats() const { return pool_->stats(); }

    void shutdown() { pool_->drain(); }

private:
    std::unique_ptr<PooledConnection> acquire_once(const std::stop_token& st);

    std::shared_ptr<IConnectionPool> pool_;
    RetryPolicy retry_;
    std::chrono::milliseconds acquire_timeout_;
};

} // namespace dbsync
