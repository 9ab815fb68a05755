#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dbsync {

struct DetectionOutcome {
    std::vector<DetectedFile> files;
    std::vector<std::string> malformed;     // One message per value that could not be parsed
};

/**
 * @brief Finds embedded asset references in a row
 *
 * Dispatch by the column's reference type:
 * - DIRECT_KEY: the trimmed string is one locator
 * - KEY_VALUE_MAP: every non-empty string value of the JSON object, key kept
 * - SIGNED_URL: the value must be an absolute http(s) URL
 *
 * A direct key whose row also carries <prefix>_url (or url) with an http(s)
 * value gets that URL as its pre-authorized locator, and the URL column
 * is not reported separately.
 */
class FileDetector {
public:
    static constexpr const char* kFileSizeColumn = "file_size";

    [[nodiscard]] static DetectionOutcome detect(const Table& table,
                                                 const SourceRow& row,
                                                 const std::string& row_id);

    [[nodiscard]] static std::optional<DetectedFile> parse_direct_key(
        const std::string& table, const std::string& row_id,
        const std::string& column, const std::string& value);

    /**
     * @throws TransformError when the value is not a JSON object
     */
    [[nodiscard]] static std::vector<DetectedFile> parse_key_map(
        const std::string& table, const std::string& row_id,
        const std::string& column, const std::string& value);

    [[nodiscard]] static std::optional<DetectedFile> parse_url(
        const std::string& table, const std::string& row_id,
        const std::string& column, const std::string& value);

    /**
     * @brief Companion URL column names for a direct-key column
     * ("cover_s3_key" -> {"cover_url", "url"})
     */
    [[nodiscard]] static std::vector<std::string> companion_url_columns(const std::string& column);
};

} // namespace dbsync
