#pragma once

#include "core/types.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace dbsync {

struct TransformOptions {
    std::string partition_column = "project_id";
    std::map<std::string, std::vector<std::string>> content_fields;     // table -> ordered columns
    std::map<std::string, std::string> table_descriptions;              // table -> description
};

/**
 * @brief Converts one source row into an IngestedRecord
 *
 * Pure in-memory work: serialization, relationship references, incoming
 * hints and searchable text. File references are attached by the caller
 * after detection.
 *
 * Thread-safe: holds only immutable state.
 */
class RecordTransformer {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    RecordTransformer(std::shared_ptr<const SchemaMap> schema,
                      TransformOptions options,
                      Clock clock = {});

    /**
     * @brief Transform a row of the given table
     * @throws TransformError on a missing row id or an unparseable value;
     *         the message names the offending column
     */
    [[nodiscard]] IngestedRecord transform(const Table& table, const SourceRow& row) const;

    /**
     * @brief Row id as text, empty when the row has none
     */
    [[nodiscard]] static std::string row_id_of(const Table& table, const SourceRow& row);

    [[nodiscard]] const SchemaMap& schema() const { return *schema_; }
    [[nodiscard]] const TransformOptions& options() const { return options_; }

private:
    void add_relationships(const Table& table,
                           const std::map<std::string, std::string>& values,
                           IngestedRecord& record) const;
    void add_incoming_hints(const Table& table, IngestedRecord& record) const;
    [[nodiscard]] std::string build_content_text(const Table& table, const SourceRow& row) const;

    std::shared_ptr<const SchemaMap> schema_;
    TransformOptions options_;
    Clock clock_;
};

} // namespace dbsync
