#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

namespace dbsync {

// Job result as printed by the CLI: per-table counts plus the error list
[[nodiscard]] nlohmann::json sync_result_to_json(const SyncResult& result);

[[nodiscard]] nlohmann::json checkpoint_to_json(const Checkpoint& checkpoint);

// Per-table checkpoints, totals and the running job, if any
[[nodiscard]] nlohmann::json sync_status_to_json(const SyncStatus& status);

} // namespace dbsync
