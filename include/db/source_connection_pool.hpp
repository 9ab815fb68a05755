#pragma once

#include "db/idb_connection.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <stop_token>
#include <string>

namespace dbsync {

struct PoolConfig {
    std::string connection_string;
    size_t min_connections = 1;
    size_t max_connections = 8;
    std::chrono::milliseconds idle_timeout{300000};     // Idle longer than this -> health check on lease
    std::chrono::seconds max_lifetime{3600};            // 0 = never recycle
    std::string health_check_query{"SELECT 1"};
};

struct PoolStats {
    size_t open = 0;
    size_t idle = 0;
    size_t leased = 0;
    size_t leases = 0;
    size_t returns = 0;
    size_t timeouts = 0;                // Includes refused connects
    size_t health_check_failures = 0;
    size_t recycled = 0;                // Past max_lifetime
};

/**
 * @brief Source connection pool seen by ConnectionManager
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Lease a connection
     * @return nullptr on timeout, refused connect, drain or stop request
     */
    [[nodiscard]] virtual std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000},
        std::stop_token st = {}) = 0;

    [[nodiscard]] virtual PoolStats stats() const = 0;

    // Close idle connections and refuse further leases
    virtual void drain() = 0;

    [[nodiscard]] virtual const std::string& name() const = 0;
};

/**
 * @brief Bounded pool of read-only source connections
 *
 * At most max_connections are open or leased at once; a counting
 * semaphore holds one permit per possible connection. Connections are
 * opened lazily beyond min_connections. A lease that was idle past
 * idle_timeout is health-checked first, one older than max_lifetime is
 * replaced. Broken leases are closed on return.
 *
 * A waiting acquire() gives up as soon as its stop token fires, so a
 * cancelled sync never sits out the full acquire timeout.
 */
class SourceConnectionPool : public IConnectionPool {
public:
    SourceConnectionPool(std::string name, PoolConfig config, std::shared_ptr<IConnectionFactory> factory);
    ~SourceConnectionPool() override;

    SourceConnectionPool(const SourceConnectionPool&) = delete;
    SourceConnectionPool& operator=(const SourceConnectionPool&) = delete;

    std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000},
        std::stop_token st = {}) override;

    PoolStats stats() const override;

    void drain() override;

    const std::string& name() const override { return name_; }

private:
    using Clock = std::chrono::steady_clock;

    struct IdleEntry {
        std::unique_ptr<IDbConnection> conn;
        Clock::time_point opened;
        Clock::time_point last_used;
    };

    // Waits for a permit in short slices so a stop request is noticed
    bool wait_for_permit(std::chrono::milliseconds timeout, const std::stop_token& st);

    std::unique_ptr<IDbConnection> open_connection();
    void close_connection(IDbConnection& conn);

    // Lease return path, bound into each PooledConnection
    void give_back(std::unique_ptr<IDbConnection> conn, Clock::time_point opened, bool broken);

    [[nodiscard]] bool expired(const IdleEntry& entry, Clock::time_point now) const;

    std::string name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    mutable std::mutex mutex_;
    std::deque<IdleEntry> idle_;            // Most recently returned at the back

    std::counting_semaphore<> permits_;
    std::atomic<bool> draining_{false};

    std::atomic<size_t> open_{0};
    std::atomic<size_t> leases_{0};
    std::atomic<size_t> returns_{0};
    std::atomic<size_t> timeouts_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> recycled_{0};
};

} // namespace dbsync
