#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace dbsync {

/**
 * @brief Index document bodies
 *
 * Nested entries (relationships, file references, incoming hints, column
 * descriptions) are stored as arrays of compact JSON strings.
 */
class DocumentBuilder {
public:
    [[nodiscard]] static nlohmann::json record_fields(const IngestedRecord& record);

    // Body of the follow-up partial update carrying download outcomes
    [[nodiscard]] static nlohmann::json file_references_update(const std::vector<FileReference>& refs);

    [[nodiscard]] static nlohmann::json file_reference_json(const FileReference& ref);
    [[nodiscard]] static nlohmann::json relationship_json(const RelationshipRef& ref);
    [[nodiscard]] static nlohmann::json incoming_hint_json(const IncomingRelationshipHint& hint);

    [[nodiscard]] static std::string table_metadata_id(const std::string& table) { return "table:" + table; }
    [[nodiscard]] static std::string schema_summary_id(const std::string& database) { return "schema:" + database; }

    [[nodiscard]] static nlohmann::json table_metadata_fields(
        const SchemaMap& schema, const Table& table,
        const std::map<std::string, std::string>& descriptions);

    [[nodiscard]] static nlohmann::json schema_summary_fields(const SchemaMap& schema);
};

// results[i] is the outcome for refs[i]
void apply_download_results(std::vector<FileReference>& refs, const std::vector<DownloadResult>& results);

[[nodiscard]] FileReference to_file_reference(const DetectedFile& file);

} // namespace dbsync
