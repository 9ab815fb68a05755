#include "schema/schema_export.hpp"
#include "core/timestamp.hpp"
#include "core/utils.hpp"
#include "db/postgresql/pg_type_map.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace dbsync {

namespace {

using json = nlohmann::json;

std::string format_count(int64_t n) {
    // 1234567 -> 1,234,567
    std::string digits = std::to_string(n < 0 ? -n : n);
    std::string out;
    for (size_t i = 0; i < digits.size(); ++i) {
        if (i > 0 && (digits.size() - i) % 3 == 0) out += ',';
        out += digits[i];
    }
    return n < 0 ? "-" + out : out;
}

std::chrono::system_clock::time_point parse_discovery_time(const std::string& text) {
    const auto micros = timestamp::parse_micros(text);
    if (!micros) return {};
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::microseconds(*micros)));
}

std::string discovery_time_string(std::chrono::system_clock::time_point tp) {
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
    return timestamp::format_micros(micros);
}

size_t total_file_columns(const SchemaMap& schema) {
    size_t n = 0;
    for (const auto& t : schema.tables) n += t.file_reference_columns.size();
    return n;
}

size_t tables_with_files(const SchemaMap& schema) {
    return static_cast<size_t>(std::count_if(schema.tables.begin(), schema.tables.end(),
        [](const Table& t) { return !t.file_reference_columns.empty(); }));
}

} // namespace

json schema_to_json(const SchemaMap& schema) {
    json tables = json::array();
    for (const auto& t : schema.tables) {
        json columns = json::array();
        for (const auto& c : t.columns) {
            columns.push_back({
                {"name", c.name},
                {"data_type", c.data_type},
                {"udt_name", c.udt_name},
                {"is_nullable", c.nullable},
                {"default_value", c.default_value ? json(*c.default_value) : json(nullptr)},
                {"max_length", c.max_length ? json(*c.max_length) : json(nullptr)},
            });
        }

        json file_columns = json::array();
        for (const auto& fc : t.file_reference_columns) {
            file_columns.push_back({
                {"column_name", fc.column},
                {"reference_type", file_reference_type_to_string(fc.type)},
                {"pattern", fc.pattern},
            });
        }

        json entry = {
            {"name", t.name},
            {"row_count", t.row_estimate},
            {"primary_key", t.primary_key},
            {"columns", std::move(columns)},
            {"timestamp_columns", t.watermark_columns},
            {"file_reference_columns", std::move(file_columns)},
        };
        if (t.discovery_error) {
            entry["error"] = *t.discovery_error;
        }
        tables.push_back(std::move(entry));
    }

    json relationships = json::array();
    for (const auto& r : schema.relationships) {
        relationships.push_back({
            {"source_table", r.source_table},
            {"source_column", r.source_column},
            {"target_table", r.target_table},
            {"target_column", r.target_column},
            {"cardinality", r.cardinality},
        });
    }

    return {
        {"discovery_timestamp", discovery_time_string(schema.discovery_timestamp)},
        {"database_name", schema.database_name},
        {"tables", std::move(tables)},
        {"relationships", std::move(relationships)},
        {"file_references_summary", {
            {"total_columns", total_file_columns(schema)},
            {"tables_with_files", tables_with_files(schema)},
        }},
    };
}

std::shared_ptr<const SchemaMap> schema_from_json(const json& doc) {
    auto map = std::make_shared<SchemaMap>();
    map->discovery_timestamp = parse_discovery_time(doc.value("discovery_timestamp", ""));
    map->database_name = doc.value("database_name", "");

    for (const auto& jt : doc.at("tables")) {
        Table t;
        t.name = jt.at("name").get<std::string>();
        t.row_estimate = jt.value("row_count", int64_t{0});
        t.primary_key = jt.value("primary_key", "");

        for (const auto& jc : jt.at("columns")) {
            Column c;
            c.name = jc.at("name").get<std::string>();
            c.data_type = jc.value("data_type", "");
            c.udt_name = jc.value("udt_name", "");
            c.type_info = PgTypeMap::build_type_info(c.data_type, c.udt_name);
            c.nullable = jc.value("is_nullable", true);
            if (jc.contains("default_value") && jc["default_value"].is_string()) {
                c.default_value = jc["default_value"].get<std::string>();
            }
            if (jc.contains("max_length") && jc["max_length"].is_number_integer()) {
                c.max_length = jc["max_length"].get<int64_t>();
            }
            t.columns.push_back(std::move(c));
        }

        t.watermark_columns = jt.value("timestamp_columns", std::vector<std::string>{});

        for (const auto& jf : jt.value("file_reference_columns", json::array())) {
            const auto type = file_reference_type_from_string(jf.value("reference_type", ""));
            if (!type) continue;
            t.file_reference_columns.emplace_back(
                jf.at("column_name").get<std::string>(), *type, jf.value("pattern", ""));
        }

        if (jt.contains("error") && jt["error"].is_string()) {
            t.discovery_error = jt["error"].get<std::string>();
        }
        map->tables.push_back(std::move(t));
    }

    for (const auto& jr : doc.value("relationships", json::array())) {
        ImplicitRelationship r(jr.at("source_table").get<std::string>(),
                               jr.at("source_column").get<std::string>(),
                               jr.at("target_table").get<std::string>());
        r.target_column = jr.value("target_column", "id");
        r.cardinality = jr.value("cardinality", "many_to_one");
        map->relationships.push_back(std::move(r));
    }

    return map;
}

std::string schema_to_markdown(const SchemaMap& schema) {
    std::ostringstream out;
    out << "# Database Schema: " << schema.database_name << "\n\n"
        << "**Discovery Time**: " << discovery_time_string(schema.discovery_timestamp) << "\n"
        << "**Tables**: " << schema.tables.size() << "\n"
        << "**Relationships**: " << schema.relationships.size() << "\n\n"
        << "---\n\n"
        << "## Tables\n\n";

    std::vector<const Table*> sorted;
    sorted.reserve(schema.tables.size());
    for (const auto& t : schema.tables) sorted.push_back(&t);
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const Table* a, const Table* b) { return a->row_estimate > b->row_estimate; });

    for (const auto* t : sorted) {
        out << "### " << t->name << "\n\n";
        if (t->discovery_error) {
            out << "**Discovery error**: " << *t->discovery_error << "\n\n---\n\n";
            continue;
        }
        out << "**Rows**: " << format_count(t->row_estimate) << "\n\n";
        if (!t->primary_key.empty()) {
            out << "**Primary Key**: `" << t->primary_key << "`\n\n";
        }

        out << "| Column | Type | Nullable | Default |\n"
            << "|--------|------|----------|---------|\n";
        for (const auto& c : t->columns) {
            std::string def = c.default_value.value_or("-");
            if (def.size() > 30) def = def.substr(0, 27) + "...";
            out << "| " << c.name << " | " << c.data_type << " | "
                << (c.nullable ? "YES" : "NO") << " | " << def << " |\n";
        }
        out << "\n";

        if (!t->file_reference_columns.empty()) {
            out << "**File Reference Columns**:\n";
            for (const auto& fc : t->file_reference_columns) {
                out << "- `" << fc.column << "` (" << file_reference_type_to_string(fc.type) << ")\n";
            }
            out << "\n";
        }

        if (!t->watermark_columns.empty()) {
            out << "**Timestamp Columns**: " << utils::join(t->watermark_columns, ", ") << "\n\n";
        }

        out << "---\n\n";
    }

    if (!schema.relationships.empty()) {
        out << "## Relationships\n\n"
            << "| Source Table | Source Column | Target Table | Target Column |\n"
            << "|--------------|---------------|--------------|---------------|\n";
        for (const auto& r : schema.relationships) {
            out << "| " << r.source_table << " | " << r.source_column << " | "
                << r.target_table << " | " << r.target_column << " |\n";
        }
        out << "\n";
    }

    out << "## File References Summary\n\n"
        << "- **Total file reference columns**: " << total_file_columns(schema) << "\n"
        << "- **Tables with file references**: " << tables_with_files(schema) << "\n";

    return out.str();
}

// ============================================================================
// Schema cache
// ============================================================================

Result<bool> save_schema_cache(const std::string& path, const SchemaMap& schema) {
    namespace fs = std::filesystem;
    std::error_code ec;
    const auto parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return Result<bool>::error(ErrorCategory::INTERNAL_ERROR,
                std::format("cannot create {}: {}", parent.string(), ec.message()));
        }
    }

    // Write beside the target, then rename over it
    const std::string tmp = path + ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) {
            return Result<bool>::error(ErrorCategory::INTERNAL_ERROR,
                std::format("cannot open {} for writing", tmp));
        }
        file << schema_to_json(schema).dump(2);
        if (!file.good()) {
            return Result<bool>::error(ErrorCategory::INTERNAL_ERROR,
                std::format("write to {} failed", tmp));
        }
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        return Result<bool>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("cannot replace {}: {}", path, ec.message()));
    }
    return Result<bool>::ok(true);
}

Result<std::shared_ptr<const SchemaMap>> load_schema_cache(const std::string& path) {
    using R = Result<std::shared_ptr<const SchemaMap>>;
    std::ifstream file(path);
    if (!file) {
        return R::error(ErrorCategory::SCHEMA_ERROR, std::format("schema cache {} not found", path));
    }
    try {
        const auto doc = json::parse(file);
        return R::ok(schema_from_json(doc));
    } catch (const json::exception& e) {
        return R::error(ErrorCategory::SCHEMA_ERROR,
            std::format("schema cache {} is unreadable: {}", path, e.what()));
    }
}

} // namespace dbsync
