#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace dbsync {

/**
 * @brief What to stream from one table
 *
 * Without a watermark column the stream is a full scan ordered by
 * id_column, resuming strictly after resume_after_id when set.
 *
 * With a watermark column the stream holds rows whose watermark is
 * non-NULL and strictly greater than watermark_after, ordered by
 * (watermark, id). When resume_after_id is also set, rows with
 * watermark == watermark_after and id > resume_after_id are included,
 * which continues an interrupted batch without skipping ties.
 */
struct ScanRequest {
    std::string table;
    std::vector<Column> columns;                    // Projection and type tags
    std::string id_column = "id";
    std::optional<std::string> watermark_column;
    std::optional<std::string> watermark_after;     // Canonical UTC form
    std::optional<std::string> resume_after_id;
    size_t batch_size = 500;
};

/**
 * @brief Pull-based, finite, non-restartable sequence of row batches
 */
class IRowStream {
public:
    virtual ~IRowStream() = default;

    /**
     * @brief Next batch of at most batch_size rows
     * @return nullopt once the stream is exhausted
     * @throws ConnectionError, QueryError, CancelledError
     */
    [[nodiscard]] virtual std::optional<std::vector<SourceRow>> next_batch() = 0;
};

/**
 * @brief Read-only view of the source database
 *
 * Catalog introspection for discovery plus table streaming for sync.
 * Implementations never write to the source.
 */
class ISourceReader {
public:
    virtual ~ISourceReader() = default;

    [[nodiscard]] virtual std::string database_name() = 0;

    /**
     * @brief Base tables of the configured schema, sorted by name
     * @throws ConnectionError, QueryError
     */
    [[nodiscard]] virtual std::vector<std::string> list_tables() = 0;

    /**
     * @brief Columns in ordinal order
     * @throws SchemaError when introspection of this table fails
     */
    [[nodiscard]] virtual std::vector<Column> list_columns(const std::string& table) = 0;

    /**
     * @brief Declared single-column primary key, nullopt if none
     */
    [[nodiscard]] virtual std::optional<std::string> primary_key(const std::string& table) = 0;

    [[nodiscard]] virtual int64_t estimate_row_count(const std::string& table) = 0;

    /**
     * @brief Up to limit distinct non-NULL values of a column, as text
     */
    [[nodiscard]] virtual std::vector<std::string> sample_values(
        const std::string& table, const std::string& column, size_t limit) = 0;

    [[nodiscard]] virtual std::unique_ptr<IRowStream> scan(
        const ScanRequest& request, std::stop_token st = {}) = 0;

    /**
     * @brief Subset of ids that still exist in the table
     */
    [[nodiscard]] virtual std::vector<std::string> existing_ids(
        const std::string& table, const std::string& id_column,
        const std::vector<std::string>& ids) = 0;
};

} // namespace dbsync
