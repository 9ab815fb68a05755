#pragma once

#include "sync/icheckpoint_store.hpp"

#include <chrono>
#include <memory>
#include <string>

struct sqlite3;

namespace dbsync {

/**
 * @brief ICheckpointStore in an SQLite file
 *
 * WAL journal with synchronous=FULL: a committed set() survives a crash.
 * Each operation opens its own connection, so concurrent table workers
 * only meet at SQLite's (short) write lock.
 */
class SqliteCheckpointStore : public ICheckpointStore {
public:
    explicit SqliteCheckpointStore(std::string path,
                                   std::chrono::milliseconds busy_timeout = std::chrono::milliseconds{5000});

    [[nodiscard]] std::optional<Checkpoint> get(const std::string& table) override;
    void set(const Checkpoint& checkpoint) override;
    [[nodiscard]] std::vector<Checkpoint> get_all() override;
    void clear(const std::optional<std::string>& table = std::nullopt) override;

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    struct SqliteCloser {
        void operator()(sqlite3* db) const;
    };
    using DbHandle = std::unique_ptr<sqlite3, SqliteCloser>;

    [[nodiscard]] DbHandle open() const;

    std::string path_;
    std::chrono::milliseconds busy_timeout_;
};

} // namespace dbsync
