#include "schema/schema_discovery.hpp"
#include "files/reference_shape.hpp"
#include "db/schema_constants.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <regex>
#include <unordered_map>

namespace dbsync {

namespace {

struct NamePattern {
    const char* text;
    std::regex re;
};

const std::vector<NamePattern>& key_map_patterns() {
    static const std::vector<NamePattern> patterns = {
        {"_s3_keys$", std::regex("_s3_keys$")},
        {"^attachments?_s3_keys$", std::regex("^attachments?_s3_keys$")},
    };
    return patterns;
}

const std::vector<NamePattern>& direct_key_patterns() {
    static const std::vector<NamePattern> patterns = {
        {"^s3_key$", std::regex("^s3_key$")},
        {"_s3_key$", std::regex("_s3_key$")},
        {"^s3_", std::regex("^s3_")},
        {"_file_key$", std::regex("_file_key$")},
        {"^file_path$|_file_path$", std::regex("^file_path$|_file_path$")},
    };
    return patterns;
}

const std::vector<NamePattern>& url_patterns() {
    static const std::vector<NamePattern> patterns = {
        {"^url$", std::regex("^url$")},
        {"_url$", std::regex("_url$")},
    };
    return patterns;
}

const NamePattern* first_match(const std::vector<NamePattern>& patterns, const std::string& name) {
    for (const auto& p : patterns) {
        if (std::regex_search(name, p.re)) return &p;
    }
    return nullptr;
}

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

int watermark_rank(const std::string& lower_name) {
    if (contains(lower_name, "updated") || contains(lower_name, "modified")) return 0;
    if (contains(lower_name, "synced")) return 1;
    if (contains(lower_name, "created") || contains(lower_name, "inserted")) return 3;
    return 2;
}

} // namespace

SchemaDiscovery::SchemaDiscovery(ISourceReader& reader, DiscoveryOptions options)
    : reader_(reader), options_(options) {}

std::shared_ptr<const SchemaMap> SchemaDiscovery::discover(std::stop_token st) {
    utils::Timer timer;
    auto map = std::make_shared<SchemaMap>();
    map->discovery_timestamp = utils::now();
    map->database_name = reader_.database_name();

    const auto names = reader_.list_tables();
    utils::log::info(std::format("Schema discovery started for '{}': {} tables",
        map->database_name, names.size()));

    map->tables.reserve(names.size());
    for (const auto& name : names) {
        if (st.stop_requested()) {
            throw CancelledError("schema discovery cancelled");
        }
        map->tables.push_back(discover_table(name));
    }

    map->relationships = infer_relationships(map->tables);

    size_t failed = 0;
    for (const auto& t : map->tables) {
        if (t.has_error()) ++failed;
    }
    utils::log::info(std::format(
        "Schema discovery finished for '{}': {} tables ({} failed), {} relationships in {}ms",
        map->database_name, map->tables.size(), failed, map->relationships.size(),
        timer.elapsed_ms().count()));

    return map;
}

Table SchemaDiscovery::discover_table(const std::string& name) {
    Table table;
    table.name = name;
    try {
        table.columns = reader_.list_columns(name);

        if (auto pk = reader_.primary_key(name)) {
            table.primary_key = std::move(*pk);
        } else if (table.find_column(std::string(db::kDefaultIdColumn))) {
            table.primary_key = std::string(db::kDefaultIdColumn);
        }

        table.row_estimate = reader_.estimate_row_count(name);
        table.watermark_columns = rank_watermark_columns(table.columns);
        table.file_reference_columns = detect_file_columns(name, table.columns);

        utils::log::debug(std::format("Discovered '{}': {} columns, ~{} rows, pk={}, watermark={}, {} file columns",
            name, table.columns.size(), table.row_estimate,
            table.primary_key.empty() ? "<none>" : table.primary_key,
            table.watermark_columns.empty() ? "<none>" : table.watermark_columns.front(),
            table.file_reference_columns.size()));
    } catch (const SchemaError& e) {
        table.discovery_error = e.what();
    } catch (const QueryError& e) {
        table.discovery_error = e.what();
    }

    if (table.discovery_error) {
        utils::log::warn(std::format("Schema discovery failed for table '{}': {}", name, *table.discovery_error));
    }
    return table;
}

std::vector<std::string> SchemaDiscovery::rank_watermark_columns(const std::vector<Column>& columns) {
    std::vector<std::pair<int, std::string>> ranked;
    for (const auto& c : columns) {
        if (!is_timestamp_type(c.type_info.generic_type)) continue;
        const auto lower = utils::to_lower(c.name);
        if (contains(lower, "deleted")) continue;
        ranked.emplace_back(watermark_rank(lower), c.name);
    }
    std::stable_sort(ranked.begin(), ranked.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<std::string> out;
    out.reserve(ranked.size());
    for (auto& [rank, name] : ranked) out.push_back(std::move(name));
    return out;
}

std::optional<FileReferenceColumn> SchemaDiscovery::match_file_column(const Column& column) {
    const auto name = utils::to_lower(column.name);
    const auto type = column.type_info.generic_type;

    if (is_json_type(type)) {
        if (const auto* p = first_match(key_map_patterns(), name)) {
            return FileReferenceColumn(column.name, FileReferenceType::KEY_VALUE_MAP, p->text);
        }
        return std::nullopt;
    }

    if (!is_string_type(type)) {
        return std::nullopt;
    }

    if (const auto* p = first_match(direct_key_patterns(), name)) {
        return FileReferenceColumn(column.name, FileReferenceType::DIRECT_KEY, p->text);
    }
    if (const auto* p = first_match(url_patterns(), name)) {
        return FileReferenceColumn(column.name, FileReferenceType::SIGNED_URL, p->text);
    }
    return std::nullopt;
}

bool SchemaDiscovery::samples_match(FileReferenceType type,
                                    const std::vector<std::string>& samples,
                                    double min_ratio) {
    if (samples.empty()) return true;

    size_t matched = 0;
    for (const auto& s : samples) {
        bool ok = false;
        switch (type) {
            case FileReferenceType::DIRECT_KEY: ok = files::is_path_like(s); break;
            case FileReferenceType::SIGNED_URL: ok = files::is_url_like(s); break;
            case FileReferenceType::KEY_VALUE_MAP: ok = files::parse_key_map(s).has_value(); break;
        }
        if (ok) ++matched;
    }
    return static_cast<double>(matched) >= min_ratio * static_cast<double>(samples.size());
}

std::vector<FileReferenceColumn> SchemaDiscovery::detect_file_columns(
    const std::string& table, const std::vector<Column>& columns) {
    std::vector<FileReferenceColumn> found;
    for (const auto& column : columns) {
        auto candidate = match_file_column(column);
        if (!candidate) continue;

        std::vector<std::string> samples;
        try {
            samples = reader_.sample_values(table, column.name, options_.file_sample_size);
        } catch (const QueryError& e) {
            utils::log::warn(std::format("Could not sample {}.{}, keeping name match: {}",
                table, column.name, e.what()));
        }

        if (samples_match(candidate->type, samples, options_.shape_match_ratio)) {
            found.push_back(std::move(*candidate));
        } else {
            utils::log::debug(std::format("{}.{} matches '{}' by name but its values do not look like {}",
                table, column.name, candidate->pattern, file_reference_type_to_string(candidate->type)));
        }
    }
    return found;
}

std::vector<std::string> SchemaDiscovery::target_table_candidates(const std::string& base) {
    std::vector<std::string> out;
    if (base.empty()) return out;

    out.push_back(base + "s");
    if (base.size() > 1 && base.back() == 'y') {
        out.push_back(base.substr(0, base.size() - 1) + "ies");
    }
    if (base.ends_with("s") || base.ends_with("x") || base.ends_with("ch") || base.ends_with("sh")) {
        out.push_back(base + "es");
    }
    out.push_back(base);
    return out;
}

std::vector<ImplicitRelationship> SchemaDiscovery::infer_relationships(const std::vector<Table>& tables) {
    // Healthy tables by name -> the column a reference resolves to
    std::unordered_map<std::string, std::string> known;
    for (const auto& t : tables) {
        if (!t.has_error()) {
            known.emplace(t.name, t.primary_key.empty() ? std::string(db::kDefaultIdColumn) : t.primary_key);
        }
    }

    std::vector<ImplicitRelationship> relationships;
    for (const auto& table : tables) {
        if (table.has_error()) continue;
        for (const auto& column : table.columns) {
            const auto& name = column.name;
            if (name == "id" || name.size() <= 3 || !name.ends_with("_id")) continue;

            const auto base = name.substr(0, name.size() - 3);
            for (const auto& candidate : target_table_candidates(base)) {
                const auto it = known.find(candidate);
                if (it != known.end()) {
                    auto& rel = relationships.emplace_back(table.name, name, candidate);
                    rel.target_column = it->second;
                    break;
                }
            }
        }
    }
    return relationships;
}

} // namespace dbsync
