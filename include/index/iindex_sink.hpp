#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace dbsync {

// Compact JSON text for the index. Bytes that are not valid UTF-8 become U+FFFD
[[nodiscard]] inline std::string encode_json(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

enum class DocumentKind {
    RECORD,             // One document per source row
    SCHEMA_METADATA     // table:<name> and schema:<database> documents
};

/**
 * @brief Downstream search index (the engine's only write surface)
 *
 * Every write throws IndexError when the index rejects it.
 */
class IIndexSink {
public:
    virtual ~IIndexSink() = default;

    // Idempotent full write, last write wins
    virtual void upsert(const std::string& doc_id, const nlohmann::json& fields,
                        DocumentKind kind = DocumentKind::RECORD) = 0;

    // Assign only the given fields of an existing document
    virtual void update(const std::string& doc_id, const nlohmann::json& fields) = 0;

    // Removing an absent document is not an error
    virtual void remove(const std::string& doc_id) = 0;

    /**
     * @brief Up to limit ids of record documents currently indexed for a table
     * @return source row ids (the part after "<table>:")
     */
    [[nodiscard]] virtual std::vector<std::string> sample_source_ids(const std::string& table,
                                                                     size_t limit) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace dbsync
