#pragma once

#include "index/iindex_sink.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <string>

namespace dbsync {

/**
 * @brief IIndexSink over the Vespa /document/v1 HTTP API
 *
 * upsert -> POST (full put), update -> PUT with "assign" operations,
 * remove -> DELETE, sample_source_ids -> visit with a source_table selection.
 * Thread-safe: one HTTP client per request.
 */
class VespaIndexSink : public IIndexSink {
public:
    struct Config {
        std::string endpoint = "http://localhost:8080";
        std::string document_namespace = "dbsync";
        std::string document_type = "source_record";
        std::string metadata_document_type = "schema_metadata";
        std::chrono::milliseconds timeout{10000};
        std::string auth_header;
    };

    explicit VespaIndexSink(Config config);

    void upsert(const std::string& doc_id, const nlohmann::json& fields,
                DocumentKind kind = DocumentKind::RECORD) override;
    void update(const std::string& doc_id, const nlohmann::json& fields) override;
    void remove(const std::string& doc_id) override;

    [[nodiscard]] std::vector<std::string> sample_source_ids(const std::string& table,
                                                             size_t limit) override;

    [[nodiscard]] std::string name() const override { return "vespa:" + config_.endpoint; }

    [[nodiscard]] std::string document_path(const std::string& doc_id,
                                            DocumentKind kind = DocumentKind::RECORD) const;

    // {"fields": {"a": {"assign": ...}}}
    [[nodiscard]] static nlohmann::json assign_body(const nlohmann::json& fields);

    // Contents of a double-quoted string in a document selection
    [[nodiscard]] static std::string selection_literal(const std::string& value);

    // "id:ns:type::orders:42" -> "orders:42"
    [[nodiscard]] static std::string user_id_of(const std::string& vespa_id);

private:
    struct Response {
        int status = 0;
        std::string body;
        std::string error;
    };

    Response send(const std::string& method, const std::string& path, const std::string& body) const;
    [[noreturn]] void fail(const std::string& what, const std::string& doc_id, const Response& r) const;

    Config config_;
    utils::HttpUrl base_;
};

} // namespace dbsync
