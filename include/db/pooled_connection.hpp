#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace dbsync {

/**
 * @brief RAII lease on a pooled connection
 *
 * Returns the connection to its pool on destruction. Move-only.
 * A lease marked broken() is closed instead of being reused.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>, bool broken)>;

    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    // Do not return this connection to the idle set
    void mark_broken() { broken_ = true; }

private:
    void release();

    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
    bool broken_ = false;
};

} // namespace dbsync
