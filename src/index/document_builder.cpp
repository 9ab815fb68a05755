#include "index/document_builder.hpp"
#include "index/iindex_sink.hpp"
#include "schema/schema_export.hpp"
#include "core/timestamp.hpp"

#include <algorithm>
#include <format>
#include <numeric>

namespace dbsync {

namespace {

using json = nlohmann::json;

json optional_string(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

std::string relationship_type_of(const std::string& column) {
    return column.ends_with("_id") && column.size() > 3 ? column.substr(0, column.size() - 3) : column;
}

std::string discovery_time(const SchemaMap& schema) {
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        schema.discovery_timestamp.time_since_epoch()).count();
    return timestamp::format_micros(micros);
}

} // namespace

json DocumentBuilder::relationship_json(const RelationshipRef& ref) {
    return {
        {"target_doc_id", ref.target_doc_id},
        {"target_table", ref.target_table},
        {"target_id", ref.target_id},
        {"source_column", ref.source_column},
        {"relationship_type", ref.relationship_type},
        {"direction", ref.direction},
        {"cardinality", ref.cardinality},
    };
}

json DocumentBuilder::incoming_hint_json(const IncomingRelationshipHint& hint) {
    return {
        {"source_table", hint.source_table},
        {"source_column", hint.source_column},
        {"relationship_type", hint.relationship_type},
        {"cardinality", hint.cardinality},
        {"query_hint", hint.query_hint},
    };
}

json DocumentBuilder::file_reference_json(const FileReference& ref) {
    json j = {
        {"locator", ref.locator},
        {"source_column", ref.column},
        {"filename", ref.filename},
        {"file_type", ref.file_type},
        {"status", download_status_to_string(ref.status)},
    };
    if (ref.map_key) j["map_key"] = *ref.map_key;
    if (ref.url) j["url"] = *ref.url;
    if (ref.local_path) j["local_path"] = *ref.local_path;
    if (!ref.reason.empty()) j["reason"] = ref.reason;
    return j;
}

json DocumentBuilder::record_fields(const IngestedRecord& record) {
    json relationships = json::array();
    for (const auto& r : record.relationships) relationships.push_back(encode_json(relationship_json(r)));

    json incoming = json::array();
    for (const auto& h : record.incoming_relationships) incoming.push_back(encode_json(incoming_hint_json(h)));

    json files = json::array();
    for (const auto& f : record.file_references) files.push_back(encode_json(file_reference_json(f)));

    json fields = {
        {"doc_id", record.doc_id},
        {"source_table", record.source_table},
        {"source_id", record.source_id},
        {"partition_key", optional_string(record.partition_key)},
        {"metadata", record.metadata},
        {"relationships", std::move(relationships)},
        {"incoming_relationships", std::move(incoming)},
        {"file_references", std::move(files)},
        {"content_text", record.content_text},
        {"column_types", record.column_types},
        {"source_modified_at", optional_string(record.source_modified_at)},
        {"created_at", optional_string(record.created_at)},
        {"ingested_at", record.ingested_at},
    };
    if (record.table_description) {
        fields["table_description"] = *record.table_description;
    }
    return fields;
}

json DocumentBuilder::file_references_update(const std::vector<FileReference>& refs) {
    json files = json::array();
    for (const auto& f : refs) files.push_back(encode_json(file_reference_json(f)));
    return {{"file_references", std::move(files)}};
}

json DocumentBuilder::table_metadata_fields(const SchemaMap& schema, const Table& table,
                                            const std::map<std::string, std::string>& descriptions) {
    const auto desc_it = descriptions.find(table.name);
    const std::string description = desc_it != descriptions.end() ? desc_it->second : "";

    json columns = json::array();
    for (const auto& c : table.columns) {
        columns.push_back(encode_json(json{
            {"name", c.name},
            {"data_type", c.data_type},
            {"is_nullable", c.nullable},
            {"default_value", optional_string(c.default_value)},
        }));
    }

    json file_columns = json::array();
    for (const auto& fc : table.file_reference_columns) {
        file_columns.push_back(encode_json(json{
            {"column_name", fc.column},
            {"reference_type", file_reference_type_to_string(fc.type)},
            {"pattern", fc.pattern},
        }));
    }

    json outgoing = json::array();
    for (const auto* r : schema.relationships_from(table.name)) {
        outgoing.push_back(encode_json(json{
            {"target_table", r->target_table},
            {"source_column", r->source_column},
            {"relationship_type", relationship_type_of(r->source_column)},
            {"cardinality", r->cardinality},
        }));
    }

    json incoming = json::array();
    for (const auto* r : schema.relationships_to(table.name)) {
        incoming.push_back(encode_json(json{
            {"source_table", r->source_table},
            {"source_column", r->source_column},
            {"relationship_type", relationship_type_of(r->source_column)},
            {"cardinality", "one_to_many"},
        }));
    }

    std::string content = table.name;
    if (!description.empty()) content += " " + description;
    for (const auto& c : table.columns) content += " " + c.name;

    return {
        {"doc_id", table_metadata_id(table.name)},
        {"metadata_type", "table"},
        {"database_name", schema.database_name},
        {"table_name", table.name},
        {"table_description", description},
        {"row_count", table.row_estimate},
        {"columns", std::move(columns)},
        {"timestamp_columns", table.watermark_columns},
        {"file_reference_columns", std::move(file_columns)},
        {"outgoing_relationships", std::move(outgoing)},
        {"incoming_relationships", std::move(incoming)},
        {"primary_key", table.primary_key},
        {"discovery_timestamp", discovery_time(schema)},
        {"content_text", content},
    };
}

json DocumentBuilder::schema_summary_fields(const SchemaMap& schema) {
    const auto exported = schema_to_json(schema);
    const auto& summary = exported.at("file_references_summary");

    std::vector<std::string> names;
    names.reserve(schema.tables.size());
    for (const auto& t : schema.tables) names.push_back(t.name);

    const int64_t total_rows = std::accumulate(schema.tables.begin(), schema.tables.end(), int64_t{0},
        [](int64_t acc, const Table& t) { return acc + t.row_estimate; });

    const json schema_summary = {
        {"table_count", schema.tables.size()},
        {"relationship_count", schema.relationships.size()},
        {"total_file_ref_columns", summary.at("total_columns")},
        {"tables_with_files", summary.at("tables_with_files")},
        {"table_names", names},
    };

    std::string content = std::format("{} database schema {} tables {} relationships",
        schema.database_name, schema.tables.size(), schema.relationships.size());
    for (const auto& n : names) content += " " + n;

    return {
        {"doc_id", schema_summary_id(schema.database_name)},
        {"metadata_type", "full_schema"},
        {"database_name", schema.database_name},
        {"table_name", ""},
        {"table_description", std::format("Full schema for {} database", schema.database_name)},
        {"row_count", total_rows},
        {"columns", json::array()},
        {"timestamp_columns", json::array()},
        {"file_reference_columns", json::array()},
        {"outgoing_relationships", json::array()},
        {"incoming_relationships", json::array()},
        {"primary_key", ""},
        {"discovery_timestamp", discovery_time(schema)},
        {"schema_summary", encode_json(schema_summary)},
        {"content_text", content},
    };
}

FileReference to_file_reference(const DetectedFile& file) {
    FileReference ref;
    ref.locator = file.locator;
    ref.column = file.column;
    ref.filename = file.filename;
    ref.file_type = file.file_type;
    ref.map_key = file.map_key;
    ref.url = file.url;
    ref.status = DownloadStatus::PENDING;
    return ref;
}

void apply_download_results(std::vector<FileReference>& refs, const std::vector<DownloadResult>& results) {
    const size_t n = std::min(refs.size(), results.size());
    for (size_t i = 0; i < n; ++i) {
        refs[i].status = results[i].status;
        refs[i].local_path = results[i].local_path;
        refs[i].reason = results[i].reason;
    }
}

} // namespace dbsync
