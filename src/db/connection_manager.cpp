#include "db/connection_manager.hpp"
#include "core/error.hpp"
#include <format>

namespace dbsync {

ConnectionManager::ConnectionManager(std::shared_ptr<IConnectionPool> pool,
                                     RetryPolicy retry,
                                     std::chrono::milliseconds acquire_timeout)
    : pool_(std::move(pool)),
      retry_(std::move(retry)),
      acquire_timeout_(acquire_timeout) {
    retry_.retryable = [](const std::exception& e) {
        return dynamic_cast<const ConnectionError*>(&e) != nullptr;
    };
}

std::unique_ptr<PooledConnection> ConnectionManager::acquire_once(const std::stop_token& st) {
    auto conn = pool_->acquire(acquire_timeout_, st);
    if (!conn) {
        if (st.stop_requested()) throw CancelledError("connection acquire cancelled");
        throw ConnectionError(std::format("could not acquire a connection to '{}' within {}ms",
                                          pool_->name(), acquire_timeout_.count()));
    }
    return conn;
}

std::unique_ptr<PooledConnection> ConnectionManager::acquire(std::stop_token st) {
    return retry_.execute([this, &st] { return acquire_once(st); }, st, "acquire connection");
}

DbResultSet ConnectionManager::query(const std::string& sql,
                                     const std::vector<DbValue>& params,
                                     std::stop_token st) {
    return retry_.execute([&] {
        auto conn = acquire_once(st);
        auto result = conn->get()->execute(sql, params);
        if (!result.success) {
            if (result.connection_lost) conn->mark_broken();
            throw_query_failure(result, "query", st);
        }
        return result;
    }, st, "source query");
}

std::unique_ptr<RowCursor> ConnectionManager::open_cursor(const std::string& sql,
                                                          const std::vector<DbValue>& params,
                                                          size_t batch_size,
                                                          std::stop_token st) {
    return retry_.execute([&] {
        return RowCursor::open(acquire_once(st), sql, params, batch_size, st);
    }, st, "open cursor");
}

} // namespace dbsync
