#pragma once

#include "db/idb_connection.hpp"
#include <libpq-fe.h>
#include <mutex>
#include <string>

namespace dbsync {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn* and provides database-agnostic interface.
 * All libpq calls are encapsulated here.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql, const std::vector<DbValue>& params = {}) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    void cancel() override;
    void close() override;

private:
    DbResultSet process_tuples_result(PGresult* res);
    DbResultSet process_command_result(PGresult* res);

    PGconn* conn_;

    // PQcancel is thread-safe; the handle itself is guarded against close()
    std::mutex cancel_mutex_;
    PGcancel* cancel_ = nullptr;
};

/**
 * @brief PostgreSQL connection factory
 *
 * Creates PgConnection instances using PQconnectdb. Every session is
 * switched to read-only transactions and UTC before it is handed out.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    explicit PgConnectionFactory(uint32_t query_timeout_ms = 0)
        : query_timeout_ms_(query_timeout_ms) {}

    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;

private:
    uint32_t query_timeout_ms_;
};

} // namespace dbsync
