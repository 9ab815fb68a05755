#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dbsync::files {

/**
 * @brief Value-shape predicates for file-reference columns
 *
 * Shared by schema discovery (is this column really a file column?) and
 * the detector (is this row's value a usable locator?).
 */

// Storage key or relative path: "co/proj/x/1/f1.pdf", "photo.jpg"
[[nodiscard]] bool is_path_like(std::string_view value);

// Absolute http(s) URL with a host
[[nodiscard]] bool is_url_like(std::string_view value);

/**
 * @brief Parse a JSON object whose values are locators
 * @return (key, value) pairs in document order, nullopt when the text is
 *         not a JSON object or any value is not a path-like string
 */
[[nodiscard]] std::optional<std::vector<std::pair<std::string, std::string>>>
parse_key_map(std::string_view json_text);

} // namespace dbsync::files
