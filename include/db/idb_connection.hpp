#pragma once

#include "core/column_type.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dbsync {

// A single text-format value; nullopt is SQL NULL
using DbValue = std::optional<std::string>;
using DbRow = std::vector<DbValue>;

/**
 * @brief Result set from a query execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    // Set when the failure left the connection unusable
    bool connection_lost = false;

    // For SELECT / FETCH
    std::vector<std::string> column_names;
    std::vector<uint32_t> column_type_oids;
    std::vector<DbRow> rows;

    // For commands
    uint64_t affected_rows = 0;

    bool has_rows = false;

    static DbResultSet failure(std::string message, bool lost = false) {
        DbResultSet r;
        r.error_message = std::move(message);
        r.connection_lost = lost;
        return r;
    }
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle. Implementations are not
 * thread-safe except for cancel(); thread safety comes from the pool.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL statement with positional parameters ($1, $2, ...)
     * @param sql SQL text
     * @param params Text-format parameter values (nullopt = NULL)
     */
    [[nodiscard]] virtual DbResultSet execute(
        const std::string& sql, const std::vector<DbValue>& params = {}) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set statement timeout for subsequent queries (0 = no timeout)
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    /**
     * @brief Ask the server to abort the statement currently running
     *
     * Safe to call from another thread while execute() is blocked.
     */
    virtual void cancel() = 0;

    virtual void close() = 0;
};

/**
 * @brief Opens connections for a pool
 *
 * create() returns nullptr when the server cannot be reached; the pool
 * turns that into a failed acquire.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(const std::string& connection_string) = 0;
};

} // namespace dbsync
