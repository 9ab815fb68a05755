#include "db/postgresql/pg_source_reader.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "db/schema_constants.hpp"
#include "core/error.hpp"
#include "core/timestamp.hpp"
#include "core/utils.hpp"
#include <format>
#include <unordered_map>

namespace dbsync {

// ============================================================================
// SQL helpers
// ============================================================================

namespace pg_sql {

std::string quote_ident(std::string_view ident) {
    std::string out;
    out.reserve(ident.size() + 2);
    out += '"';
    for (const char c : ident) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string text_array_literal(const std::vector<std::string>& values) {
    std::string out = "{";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ',';
        out += '"';
        for (const char c : values[i]) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += '"';
    }
    out += '}';
    return out;
}

std::string build_scan_query(const std::string& schema,
                             const ScanRequest& request,
                             std::vector<DbValue>& params) {
    params.clear();

    std::string projection;
    if (request.columns.empty()) {
        projection = "*";
    } else {
        std::vector<std::string> cols;
        cols.reserve(request.columns.size());
        for (const auto& c : request.columns) cols.push_back(quote_ident(c.name));
        projection = utils::join(cols, ", ");
    }

    const std::string id = quote_ident(request.id_column);
    std::string sql = std::format("SELECT {} FROM {}.{}",
        projection, quote_ident(schema), quote_ident(request.table));

    if (!request.watermark_column) {
        if (request.resume_after_id) {
            params.emplace_back(*request.resume_after_id);
            sql += std::format(" WHERE {} > $1", id);
        }
        sql += std::format(" ORDER BY {} ASC", id);
        return sql;
    }

    const std::string wm = quote_ident(*request.watermark_column);
    sql += std::format(" WHERE {} IS NOT NULL", wm);
    if (request.watermark_after) {
        params.emplace_back(*request.watermark_after);
        if (request.resume_after_id) {
            params.emplace_back(*request.resume_after_id);
            sql += std::format(" AND ({0} > $1 OR ({0} = $1 AND {1} > $2))", wm, id);
        } else {
            sql += std::format(" AND {} > $1", wm);
        }
    }
    sql += std::format(" ORDER BY {} ASC, {} ASC", wm, id);
    return sql;
}

} // namespace pg_sql

// ============================================================================
// Row stream
// ============================================================================

namespace {

class PgRowStream : public IRowStream {
public:
    PgRowStream(std::shared_ptr<ConnectionManager> connections, std::string schema,
                ScanRequest request, std::stop_token st)
        : connections_(std::move(connections)),
          schema_(std::move(schema)),
          request_(std::move(request)),
          stop_(std::move(st)) {
        for (const auto& c : request_.columns) {
            types_.emplace(c.name, c.type_info);
        }
    }

    std::optional<std::vector<SourceRow>> next_batch() override {
        if (done_) return std::nullopt;
        return connections_->retry_policy().execute(
            [this] { return fetch_once(); }, stop_,
            std::format("stream '{}'", request_.table));
    }

private:
    std::optional<std::vector<SourceRow>> fetch_once() {
        try {
            if (!cursor_) {
                std::vector<DbValue> params;
                const auto sql = pg_sql::build_scan_query(schema_, request_, params);
                cursor_ = connections_->open_cursor(sql, params, request_.batch_size, stop_);
            }
            auto batch = cursor_->next_batch();
            if (!batch) {
                cursor_->close();
                cursor_.reset();
                done_ = true;
                return std::nullopt;
            }
            auto rows = to_rows(*batch);
            remember_position(rows.back());
            return rows;
        } catch (const ConnectionError&) {
            // Reopened after the last delivered row on the next attempt
            cursor_.reset();
            throw;
        }
    }

    std::vector<SourceRow> to_rows(const DbResultSet& rs) const {
        std::vector<ColumnTypeInfo> col_types;
        col_types.reserve(rs.column_names.size());
        for (const auto& name : rs.column_names) {
            const auto it = types_.find(name);
            col_types.push_back(it != types_.end() ? it->second : ColumnTypeInfo{});
        }

        std::vector<SourceRow> rows;
        rows.reserve(rs.rows.size());
        for (const auto& raw : rs.rows) {
            SourceRow row;
            row.fields.reserve(raw.size());
            for (size_t i = 0; i < raw.size() && i < rs.column_names.size(); ++i) {
                row.fields.emplace_back(rs.column_names[i], col_types[i], raw[i]);
            }
            rows.push_back(std::move(row));
        }
        return rows;
    }

    void remember_position(const SourceRow& last) {
        if (auto id = last.value(request_.id_column)) {
            request_.resume_after_id = std::move(id);
        }
        if (request_.watermark_column) {
            if (const auto wm = last.value(*request_.watermark_column)) {
                request_.watermark_after = timestamp::normalize(*wm).value_or(*wm);
            }
        }
    }

    std::shared_ptr<ConnectionManager> connections_;
    std::string schema_;
    ScanRequest request_;
    std::stop_token stop_;
    std::unordered_map<std::string, ColumnTypeInfo> types_;
    std::unique_ptr<RowCursor> cursor_;
    bool done_ = false;
};

} // namespace

// ============================================================================
// PgSourceReader
// ============================================================================

PgSourceReader::PgSourceReader(std::shared_ptr<ConnectionManager> connections, std::string schema)
    : connections_(std::move(connections)), schema_(std::move(schema)) {}

std::string PgSourceReader::qualified(const std::string& table) const {
    return pg_sql::quote_ident(schema_) + "." + pg_sql::quote_ident(table);
}

std::string PgSourceReader::database_name() {
    const auto rs = connections_->query("SELECT current_database()");
    if (rs.rows.empty() || !rs.rows[0][0]) return "unknown";
    return *rs.rows[0][0];
}

std::vector<std::string> PgSourceReader::list_tables() {
    static constexpr const char* TABLES_QUERY =
        "SELECT table_name "
        "FROM information_schema.tables "
        "WHERE table_schema = $1 AND table_type = 'BASE TABLE' "
        "ORDER BY table_name";

    const auto rs = connections_->query(TABLES_QUERY, {schema_});
    std::vector<std::string> tables;
    tables.reserve(rs.rows.size());
    for (const auto& row : rs.rows) {
        if (row[0]) tables.push_back(*row[0]);
    }
    return tables;
}

std::vector<Column> PgSourceReader::list_columns(const std::string& table) {
    static constexpr const char* COLUMNS_QUERY =
        "SELECT "
        "    column_name, "
        "    data_type, "
        "    udt_name, "
        "    is_nullable, "
        "    column_default, "
        "    character_maximum_length "
        "FROM information_schema.columns "
        "WHERE table_schema = $1 AND table_name = $2 "
        "ORDER BY ordinal_position";

    // Column indices in the result set (matching the SELECT order)
    static constexpr int COL_NAME        = 0;
    static constexpr int COL_DATA_TYPE   = 1;
    static constexpr int COL_UDT         = 2;
    static constexpr int COL_IS_NULLABLE = 3;
    static constexpr int COL_DEFAULT     = 4;
    static constexpr int COL_MAX_LENGTH  = 5;

    DbResultSet rs;
    try {
        rs = connections_->query(COLUMNS_QUERY, {schema_, table});
    } catch (const QueryError& e) {
        throw SchemaError(std::format("column introspection failed for '{}': {}", table, e.what()));
    }

    if (rs.rows.empty()) {
        throw SchemaError(std::format("no visible columns for table '{}'", table));
    }

    std::vector<Column> columns;
    columns.reserve(rs.rows.size());
    for (const auto& row : rs.rows) {
        Column col;
        col.name = row[COL_NAME].value_or("");
        col.data_type = row[COL_DATA_TYPE].value_or("");
        col.udt_name = row[COL_UDT].value_or("");
        col.type_info = PgTypeMap::build_type_info(col.data_type, col.udt_name);
        const std::string nullable = row[COL_IS_NULLABLE].value_or(std::string(db::kYes));
        col.nullable = (nullable == db::kYes || nullable == db::kYesLow);
        col.default_value = row[COL_DEFAULT];
        if (row[COL_MAX_LENGTH]) {
            col.max_length = utils::try_parse_int<int64_t>(*row[COL_MAX_LENGTH]);
        }
        columns.push_back(std::move(col));
    }
    return columns;
}

std::optional<std::string> PgSourceReader::primary_key(const std::string& table) {
    static constexpr const char* PK_QUERY =
        "SELECT a.attname "
        "FROM pg_index i "
        "JOIN pg_class c ON c.oid = i.indrelid "
        "JOIN pg_namespace n ON n.oid = c.relnamespace "
        "JOIN pg_attribute a ON a.attrelid = c.oid AND a.attnum = ANY(i.indkey) "
        "WHERE i.indisprimary AND n.nspname = $1 AND c.relname = $2";

    const auto rs = connections_->query(PK_QUERY, {schema_, table});
    // Composite keys cannot serve as a single row id
    if (rs.rows.size() != 1 || !rs.rows[0][0]) return std::nullopt;
    return rs.rows[0][0];
}

int64_t PgSourceReader::estimate_row_count(const std::string& table) {
    static constexpr const char* ESTIMATE_QUERY =
        "SELECT c.reltuples::bigint "
        "FROM pg_class c "
        "JOIN pg_namespace n ON n.oid = c.relnamespace "
        "WHERE n.nspname = $1 AND c.relname = $2";

    const auto rs = connections_->query(ESTIMATE_QUERY, {schema_, table});
    int64_t estimate = -1;
    if (!rs.rows.empty() && rs.rows[0][0]) {
        estimate = utils::parse_int<int64_t>(*rs.rows[0][0], -1);
    }
    if (estimate >= 0) return estimate;

    // Never analyzed: reltuples is -1
    const auto count = connections_->query(std::format("SELECT COUNT(*) FROM {}", qualified(table)));
    if (count.rows.empty() || !count.rows[0][0]) return 0;
    return utils::parse_int<int64_t>(*count.rows[0][0], 0);
}

std::vector<std::string> PgSourceReader::sample_values(
    const std::string& table, const std::string& column, size_t limit) {
    const auto col = pg_sql::quote_ident(column);
    const auto rs = connections_->query(std::format(
        "SELECT {0}::text FROM {1} WHERE {0} IS NOT NULL LIMIT {2}",
        col, qualified(table), limit));

    std::vector<std::string> values;
    values.reserve(rs.rows.size());
    for (const auto& row : rs.rows) {
        if (row[0]) values.push_back(*row[0]);
    }
    return values;
}

std::unique_ptr<IRowStream> PgSourceReader::scan(const ScanRequest& request, std::stop_token st) {
    return std::make_unique<PgRowStream>(connections_, schema_, request, std::move(st));
}

std::vector<std::string> PgSourceReader::existing_ids(
    const std::string& table, const std::string& id_column,
    const std::vector<std::string>& ids) {
    if (ids.empty()) return {};

    const auto col = pg_sql::quote_ident(id_column);
    const auto rs = connections_->query(
        std::format("SELECT {0}::text FROM {1} WHERE {0}::text = ANY($1::text[])", col, qualified(table)),
        {pg_sql::text_array_literal(ids)});

    std::vector<std::string> found;
    found.reserve(rs.rows.size());
    for (const auto& row : rs.rows) {
        if (row[0]) found.push_back(*row[0]);
    }
    return found;
}

} // namespace dbsync
