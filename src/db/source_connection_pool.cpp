#include "db/source_connection_pool.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <optional>
#include <format>

namespace dbsync {

namespace {

constexpr std::chrono::milliseconds kStopPollInterval{50};

} // anonymous namespace

SourceConnectionPool::SourceConnectionPool(std::string name, PoolConfig config,
                                           std::shared_ptr<IConnectionFactory> factory)
    : name_(std::move(name)),
      config_(std::move(config)),
      factory_(std::move(factory)),
      permits_(static_cast<std::ptrdiff_t>(config_.max_connections)) {

    const size_t warm = std::min(config_.min_connections, config_.max_connections);
    for (size_t i = 0; i < warm; ++i) {
        auto conn = open_connection();
        if (!conn) {
            utils::log::warn(std::format("Pool '{}': could not open warm connection {} of {}", name_, i + 1, warm));
            break;
        }
        const auto now = Clock::now();
        std::lock_guard lock(mutex_);
        idle_.push_back(IdleEntry{std::move(conn), now, now});
    }

    utils::log::info(std::format("Pool '{}' ready: {} open (min={}, max={})",
        name_, open_.load(), config_.min_connections, config_.max_connections));
}

SourceConnectionPool::~SourceConnectionPool() {
    drain();
}

bool SourceConnectionPool::wait_for_permit(std::chrono::milliseconds timeout, const std::stop_token& st) {
    const auto deadline = Clock::now() + timeout;
    while (true) {
        if (st.stop_requested()) return false;
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (left <= std::chrono::milliseconds::zero()) return permits_.try_acquire();
        if (permits_.try_acquire_for(std::min(left, kStopPollInterval))) return true;
    }
}

bool SourceConnectionPool::expired(const IdleEntry& entry, Clock::time_point now) const {
    return config_.max_lifetime.count() > 0 && now - entry.opened > config_.max_lifetime;
}

std::unique_ptr<PooledConnection> SourceConnectionPool::acquire(std::chrono::milliseconds timeout,
                                                                std::stop_token st) {
    if (draining_.load()) return nullptr;

    if (!wait_for_permit(timeout, st)) {
        if (!st.stop_requested()) timeouts_.fetch_add(1);
        return nullptr;
    }
    if (draining_.load()) {
        permits_.release();
        return nullptr;
    }

    std::optional<IdleEntry> entry;
    {
        std::lock_guard lock(mutex_);
        if (!idle_.empty()) {
            entry = std::move(idle_.back());
            idle_.pop_back();
        }
    }

    const auto now = Clock::now();
    if (entry && expired(*entry, now)) {
        close_connection(*entry->conn);
        recycled_.fetch_add(1);
        entry.reset();
    }
    if (entry && now - entry->last_used > config_.idle_timeout &&
        !entry->conn->is_healthy(config_.health_check_query)) {
        utils::log::debug(std::format("Pool '{}': idle connection failed its health check", name_));
        close_connection(*entry->conn);
        health_check_failures_.fetch_add(1);
        entry.reset();
    }

    std::unique_ptr<IDbConnection> conn;
    Clock::time_point opened = now;
    if (entry) {
        conn = std::move(entry->conn);
        opened = entry->opened;
    } else {
        conn = open_connection();
        if (!conn) {
            permits_.release();
            timeouts_.fetch_add(1);
            return nullptr;
        }
    }

    leases_.fetch_add(1);
    return std::make_unique<PooledConnection>(std::move(conn),
        [this, opened](std::unique_ptr<IDbConnection> c, bool broken) {
            give_back(std::move(c), opened, broken);
        });
}

void SourceConnectionPool::give_back(std::unique_ptr<IDbConnection> conn, Clock::time_point opened, bool broken) {
    if (!conn) return;
    returns_.fetch_add(1);

    if (broken || draining_.load()) {
        close_connection(*conn);
    } else {
        std::lock_guard lock(mutex_);
        idle_.push_back(IdleEntry{std::move(conn), opened, Clock::now()});
    }
    permits_.release();
}

PoolStats SourceConnectionPool::stats() const {
    PoolStats s;
    {
        std::lock_guard lock(mutex_);
        s.idle = idle_.size();
    }
    s.open = open_.load();
    s.leased = s.open >= s.idle ? s.open - s.idle : 0;
    s.leases = leases_.load();
    s.returns = returns_.load();
    s.timeouts = timeouts_.load();
    s.health_check_failures = health_check_failures_.load();
    s.recycled = recycled_.load();
    return s;
}

void SourceConnectionPool::drain() {
    if (draining_.exchange(true)) return;

    std::deque<IdleEntry> closing;
    {
        std::lock_guard lock(mutex_);
        closing.swap(idle_);
    }
    for (auto& e : closing) close_connection(*e.conn);

    utils::log::info(std::format("Pool '{}' drained ({} leases, {} timeouts)",
        name_, leases_.load(), timeouts_.load()));
}

std::unique_ptr<IDbConnection> SourceConnectionPool::open_connection() {
    auto conn = factory_->create(config_.connection_string);
    if (conn) open_.fetch_add(1);
    return conn;
}

void SourceConnectionPool::close_connection(IDbConnection& conn) {
    conn.close();
    open_.fetch_sub(1);
}

} // namespace dbsync
