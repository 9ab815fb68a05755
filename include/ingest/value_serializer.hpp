#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace dbsync {

/**
 * @brief Deterministic string form of one source value
 *
 * - integers: validated, decimal without leading '+' or zeros
 * - floating/numeric: validated, source text kept (no rounding)
 * - booleans: "true" / "false"
 * - timestamps: YYYY-MM-DDTHH:MM:SS.ffffffZ (UTC)
 * - dates: YYYY-MM-DD
 * - json/jsonb: canonical JSON (sorted keys, compact)
 * - arrays: canonical JSON array, elements typed by the element type
 * - everything else: the source text unchanged
 *
 * @return nullopt for SQL NULL (the field is omitted, never "")
 * @throws TransformError when the text does not parse as its declared type
 */
[[nodiscard]] std::optional<std::string> serialize_value(const SourceField& field);

/**
 * @brief Parse a PostgreSQL array literal ("{1,2,NULL}", "{{a,b},{c,d}}")
 * @throws TransformError on malformed input
 */
[[nodiscard]] nlohmann::json parse_pg_array(std::string_view text, GenericColumnType element_type);

} // namespace dbsync
