#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dbsync::timestamp {

/**
 * @brief Parse a PostgreSQL or ISO-8601 timestamp into UTC microseconds
 *
 * Accepts "YYYY-MM-DD[ T]HH:MM[:SS[.f{1,6}]]" followed by an optional
 * "Z", "+HH", "+HHMM" or "+HH:MM" offset. Values without an offset are
 * taken as UTC. A bare "YYYY-MM-DD" is midnight UTC.
 *
 * @return nullopt when the text is not a valid timestamp
 */
[[nodiscard]] std::optional<int64_t> parse_micros(std::string_view text);

// Canonical form: 2024-05-01T12:00:00.000000Z
[[nodiscard]] std::string format_micros(int64_t micros);

// parse_micros + format_micros; nullopt when unparseable
[[nodiscard]] std::optional<std::string> normalize(std::string_view text);

// Validates a calendar date and returns it as YYYY-MM-DD
[[nodiscard]] std::optional<std::string> normalize_date(std::string_view text);

} // namespace dbsync::timestamp
