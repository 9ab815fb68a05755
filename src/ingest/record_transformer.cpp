#include "ingest/record_transformer.hpp"
#include "ingest/value_serializer.hpp"
#include "core/timestamp.hpp"
#include "core/utils.hpp"

#include <format>

namespace dbsync {

namespace {

std::string relationship_type_of(const std::string& column) {
    if (column.size() > 3 && column.ends_with("_id")) {
        return column.substr(0, column.size() - 3);
    }
    return column;
}

bool is_created_column(const std::string& name) {
    const auto lower = utils::to_lower(name);
    return lower == "created_at" || lower == "createdat" || lower == "created";
}

} // namespace

RecordTransformer::RecordTransformer(std::shared_ptr<const SchemaMap> schema,
                                     TransformOptions options,
                                     Clock clock)
    : schema_(std::move(schema)),
      options_(std::move(options)),
      clock_(clock ? std::move(clock) : Clock(&utils::now)) {}

std::string RecordTransformer::row_id_of(const Table& table, const SourceRow& row) {
    const auto id = row.value(table.primary_key);
    return id ? utils::trim(*id) : std::string{};
}

IngestedRecord RecordTransformer::transform(const Table& table, const SourceRow& row) const {
    IngestedRecord record;
    record.source_table = table.name;
    record.source_id = row_id_of(table, row);
    if (record.source_id.empty()) {
        throw TransformError(std::format("row has no value in id column '{}'", table.primary_key));
    }
    record.doc_id = make_doc_id(table.name, record.source_id);

    for (const auto& field : row.fields) {
        std::optional<std::string> serialized;
        try {
            serialized = serialize_value(field);
        } catch (const TransformError& e) {
            throw TransformError(std::format("column '{}': {}", field.name, e.what()));
        }
        if (serialized) {
            record.metadata.emplace(field.name, std::move(*serialized));
        }
    }

    for (const auto& column : table.columns) {
        record.column_types.emplace(column.name, column.data_type);
    }

    if (const auto it = record.metadata.find(options_.partition_column); it != record.metadata.end()) {
        record.partition_key = it->second;
    }

    if (const auto wm = table.watermark_column()) {
        if (const auto it = record.metadata.find(*wm); it != record.metadata.end()) {
            record.source_modified_at = it->second;
        }
    }
    for (const auto& [name, value] : record.metadata) {
        if (is_created_column(name)) {
            record.created_at = value;
            break;
        }
    }

    if (const auto it = options_.table_descriptions.find(table.name); it != options_.table_descriptions.end()) {
        record.table_description = it->second;
    }

    add_relationships(table, record.metadata, record);
    add_incoming_hints(table, record);
    record.content_text = build_content_text(table, row);
    record.ingested_at = utils::to_epoch_ms(clock_());
    return record;
}

void RecordTransformer::add_relationships(const Table& table,
                                          const std::map<std::string, std::string>& values,
                                          IngestedRecord& record) const {
    for (const auto* rel : schema_->relationships_from(table.name)) {
        const auto it = values.find(rel->source_column);
        if (it == values.end() || it->second.empty()) {
            ++record.relationships_skipped;
            continue;
        }
        RelationshipRef ref;
        ref.target_table = rel->target_table;
        ref.target_id = it->second;
        ref.target_doc_id = make_doc_id(rel->target_table, it->second);
        ref.source_column = rel->source_column;
        ref.relationship_type = relationship_type_of(rel->source_column);
        ref.cardinality = rel->cardinality;
        record.relationships.push_back(std::move(ref));
    }
}

void RecordTransformer::add_incoming_hints(const Table& table, IngestedRecord& record) const {
    for (const auto* rel : schema_->relationships_to(table.name)) {
        IncomingRelationshipHint hint;
        hint.source_table = rel->source_table;
        hint.source_column = rel->source_column;
        hint.relationship_type = relationship_type_of(rel->source_column);
        hint.query_hint = std::format("Find {} where {} = {}",
            rel->source_table, rel->source_column, record.source_id);
        record.incoming_relationships.push_back(std::move(hint));
    }
}

std::string RecordTransformer::build_content_text(const Table& table, const SourceRow& row) const {
    std::vector<std::string> parts;
    const auto append = [&parts](const std::optional<std::string>& text) {
        if (!text) return;
        auto trimmed = utils::trim(*text);
        if (!trimmed.empty()) parts.push_back(std::move(trimmed));
    };

    if (const auto it = options_.content_fields.find(table.name);
        it != options_.content_fields.end() && !it->second.empty()) {
        for (const auto& column : it->second) {
            append(row.value(column));
        }
        return utils::join(parts, " ");
    }

    // No configured content columns: every string column that is not a file reference
    for (const auto& field : row.fields) {
        if (!is_string_type(field.type.generic_type)) continue;
        if (table.find_file_column(field.name)) continue;
        append(field.text);
    }
    return utils::join(parts, " ");
}

} // namespace dbsync
