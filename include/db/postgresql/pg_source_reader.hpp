#pragma once

#include "db/connection_manager.hpp"
#include "db/isource_reader.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace dbsync {

namespace pg_sql {

// "name" with embedded quotes doubled
[[nodiscard]] std::string quote_ident(std::string_view ident);

// {"a","b"} literal for a text[] parameter
[[nodiscard]] std::string text_array_literal(const std::vector<std::string>& values);

/**
 * @brief Build the keyset-paginated SELECT for a scan
 * @param params Receives the positional parameter values
 */
[[nodiscard]] std::string build_scan_query(const std::string& schema,
                                           const ScanRequest& request,
                                           std::vector<DbValue>& params);

} // namespace pg_sql

/**
 * @brief ISourceReader over PostgreSQL catalogs and server-side cursors
 *
 * All access goes through the ConnectionManager. A scan whose cursor
 * loses its connection mid-stream is reopened after the last delivered
 * row, within the manager's retry budget.
 */
class PgSourceReader : public ISourceReader {
public:
    PgSourceReader(std::shared_ptr<ConnectionManager> connections, std::string schema = "public");

    std::string database_name() override;
    std::vector<std::string> list_tables() override;
    std::vector<Column> list_columns(const std::string& table) override;
    std::optional<std::string> primary_key(const std::string& table) override;
    int64_t estimate_row_count(const std::string& table) override;
    std::vector<std::string> sample_values(
        const std::string& table, const std::string& column, size_t limit) override;
    std::unique_ptr<IRowStream> scan(const ScanRequest& request, std::stop_token st = {}) override;
    std::vector<std::string> existing_ids(
        const std::string& table, const std::string& id_column,
        const std::vector<std::string>& ids) override;

private:
    [[nodiscard]] std::string qualified(const std::string& table) const;

    std::shared_ptr<ConnectionManager> connections_;
    std::string schema_;
};

} // namespace dbsync
