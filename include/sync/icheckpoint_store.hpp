#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dbsync {

/**
 * @brief Durable per-table sync progress
 *
 * set() replaces the table's checkpoint atomically. Operations on different
 * tables are independent. Failures throw CheckpointError.
 */
class ICheckpointStore {
public:
    virtual ~ICheckpointStore() = default;

    [[nodiscard]] virtual std::optional<Checkpoint> get(const std::string& table) = 0;

    virtual void set(const Checkpoint& checkpoint) = 0;

    // Sorted by table name
    [[nodiscard]] virtual std::vector<Checkpoint> get_all() = 0;

    // One table, or every table when nullopt
    virtual void clear(const std::optional<std::string>& table = std::nullopt) = 0;
};

} // namespace dbsync
