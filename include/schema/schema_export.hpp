#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace dbsync {

/**
 * @brief Structured form of a SchemaMap (round-trips through schema_from_json)
 */
[[nodiscard]] nlohmann::json schema_to_json(const SchemaMap& schema);

/**
 * @throws nlohmann::json::exception on a malformed document
 */
[[nodiscard]] std::shared_ptr<const SchemaMap> schema_from_json(const nlohmann::json& doc);

/**
 * @brief Human-readable form: tables by descending row estimate, then
 * relationships, then a file-reference summary
 */
[[nodiscard]] std::string schema_to_markdown(const SchemaMap& schema);

// ============================================================================
// Schema cache (JSON file)
// ============================================================================

[[nodiscard]] Result<bool> save_schema_cache(const std::string& path, const SchemaMap& schema);

[[nodiscard]] Result<std::shared_ptr<const SchemaMap>> load_schema_cache(const std::string& path);

} // namespace dbsync
