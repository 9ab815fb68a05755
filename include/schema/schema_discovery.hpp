#pragma once

#include "core/types.hpp"
#include "db/isource_reader.hpp"
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace dbsync {

struct DiscoveryOptions {
    size_t file_sample_size = 20;       // Values sampled per candidate file column
    double shape_match_ratio = 0.8;     // Share of samples that must have the expected shape
};

/**
 * @brief Catalog introspection producing an immutable SchemaMap
 *
 * Per table: columns, primary key (falling back to a column named "id"),
 * row estimate, ranked watermark candidates and file-reference columns.
 * Then relationships are inferred across all healthy tables.
 *
 * A table whose introspection fails is kept with discovery_error set and
 * takes no part in relationship inference. Only connection loss or
 * cancellation aborts discovery as a whole.
 */
class SchemaDiscovery {
public:
    explicit SchemaDiscovery(ISourceReader& reader, DiscoveryOptions options = {});

    /**
     * @throws ConnectionError, CancelledError
     */
    [[nodiscard]] std::shared_ptr<const SchemaMap> discover(std::stop_token st = {});

    /**
     * @brief Timestamp columns ordered by preference
     *
     * "updated"/"modified" names rank first, then "synced", then any other
     * timestamp, then "created"/"inserted". Soft-delete markers are never
     * candidates. Ties keep column order.
     */
    [[nodiscard]] static std::vector<std::string> rank_watermark_columns(const std::vector<Column>& columns);

    /**
     * @brief First stage of file detection: column name and type only
     */
    [[nodiscard]] static std::optional<FileReferenceColumn> match_file_column(const Column& column);

    /**
     * @brief Second stage: do the sampled values have the expected shape
     *
     * An empty sample cannot contradict the name and is accepted.
     */
    [[nodiscard]] static bool samples_match(FileReferenceType type,
                                            const std::vector<std::string>& samples,
                                            double min_ratio = 0.8);

    /**
     * @brief Table names tried, in order, for a "<base>_id" column
     *
     * base+"s", then "y" -> "ies", then "s/x/ch/sh" -> +"es", then base.
     */
    [[nodiscard]] static std::vector<std::string> target_table_candidates(const std::string& base);

    /**
     * @brief Naming-convention relationships whose target table exists
     */
    [[nodiscard]] static std::vector<ImplicitRelationship> infer_relationships(const std::vector<Table>& tables);

private:
    Table discover_table(const std::string& name);
    std::vector<FileReferenceColumn> detect_file_columns(const std::string& table,
                                                         const std::vector<Column>& columns);

    ISourceReader& reader_;
    DiscoveryOptions options_;
};

} // namespace dbsync
