#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>

namespace dbsync {

namespace {

struct PGResultDeleter {
    void operator()(PGresult* res) const noexcept {
        if (res) {
            PQclear(res);
        }
    }
};
using PGResultPtr = std::unique_ptr<PGresult, PGResultDeleter>;

// Session settings applied to every new connection
constexpr const char* kSessionSetup =
    "SET SESSION CHARACTERISTICS AS TRANSACTION READ ONLY; "
    "SET TIME ZONE 'UTC'; "
    "SET client_encoding = 'UTF8'";

} // namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {
    if (conn_) {
        cancel_ = PQgetCancel(conn_);
    }
}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql, const std::vector<DbValue>& params) {
    if (!conn_) {
        return DbResultSet::failure("Connection is null", true);
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p ? p->c_str() : nullptr);
    }

    PGResultPtr res(params.empty()
        ? PQexec(conn_, sql.c_str())
        : PQexecParams(conn_, sql.c_str(), static_cast<int>(values.size()),
                       nullptr, values.data(), nullptr, nullptr, 0));

    if (!res) {
        return DbResultSet::failure(PQerrorMessage(conn_), PQstatus(conn_) != CONNECTION_OK);
    }

    const ExecStatusType status = PQresultStatus(res.get());

    if (status == PGRES_TUPLES_OK) {
        return process_tuples_result(res.get());
    }

    if (status == PGRES_COMMAND_OK) {
        return process_command_result(res.get());
    }

    std::string error = utils::trim(PQresultErrorMessage(res.get()));
    if (error.empty()) error = utils::trim(PQerrorMessage(conn_));
    return DbResultSet::failure(std::move(error), PQstatus(conn_) != CONNECTION_OK);
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }

    PGResultPtr res(PQexec(conn_, health_check_query.c_str()));
    if (!res) {
        return false;
    }

    const ExecStatusType status = PQresultStatus(res.get());
    return (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK);
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    const std::string timeout_sql = std::format("SET statement_timeout = {}", timeout_ms);
    PGResultPtr res(PQexec(conn_, timeout_sql.c_str()));
    return res && PQresultStatus(res.get()) == PGRES_COMMAND_OK;
}

void PgConnection::cancel() {
    std::lock_guard lock(cancel_mutex_);
    if (!cancel_) {
        return;
    }
    char errbuf[256];
    if (!PQcancel(cancel_, errbuf, sizeof(errbuf))) {
        utils::log::warn(std::format("Failed to cancel running query: {}", errbuf));
    }
}

void PgConnection::close() {
    {
        std::lock_guard lock(cancel_mutex_);
        if (cancel_) {
            PQfreeCancel(cancel_);
            cancel_ = nullptr;
        }
    }
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    for (int i = 0; i < ncols; i++) {
        result.column_names.emplace_back(PQfname(res, i));
        result.column_type_oids.push_back(static_cast<uint32_t>(PQftype(res, i)));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);

    for (int i = 0; i < nrows; i++) {
        DbRow row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res, i, j),
                                             static_cast<size_t>(PQgetlength(res, i, j))));
            }
        }
        result.rows.push_back(std::move(row));
    }

    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = utils::parse_int<uint64_t>(affected);
    }

    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect: {}", utils::trim(PQerrorMessage(conn))));
        PQfinish(conn);
        return nullptr;
    }

    auto pg = std::make_unique<PgConnection>(conn);

    const auto setup = pg->execute(kSessionSetup);
    if (!setup.success) {
        utils::log::error(std::format("Failed to configure session: {}", setup.error_message));
        return nullptr;
    }

    if (query_timeout_ms_ > 0 && !pg->set_query_timeout(query_timeout_ms_)) {
        utils::log::warn(std::format("Failed to set statement_timeout to {}ms", query_timeout_ms_));
    }

    return pg;
}

} // namespace dbsync
