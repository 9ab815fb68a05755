#define CPPHTTPLIB_OPENSSL_SUPPORT
#include "index/vespa_index_sink.hpp"
#include "core/error.hpp"

#include <httplib.h>

#include <format>

namespace dbsync {

namespace {

constexpr const char* kJsonContentType = "application/json";
constexpr size_t kMaxErrorBody = 300;

} // namespace

std::string VespaIndexSink::selection_literal(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

VespaIndexSink::VespaIndexSink(Config config)
    : config_(std::move(config)) {
    auto url = utils::parse_http_url(config_.endpoint);
    if (!url) {
        throw SyncError(ErrorCategory::CONFIG_ERROR,
            std::format("invalid index endpoint '{}'", config_.endpoint));
    }
    base_ = std::move(*url);
    while (base_.path.size() > 1 && base_.path.ends_with('/')) base_.path.pop_back();
    if (base_.path == "/") base_.path.clear();
}

std::string VespaIndexSink::document_path(const std::string& doc_id, DocumentKind kind) const {
    const auto& type = kind == DocumentKind::SCHEMA_METADATA
        ? config_.metadata_document_type : config_.document_type;
    return std::format("{}/document/v1/{}/{}/docid/{}",
        base_.path, config_.document_namespace, type, utils::url_encode(doc_id));
}

nlohmann::json VespaIndexSink::assign_body(const nlohmann::json& fields) {
    nlohmann::json ops = nlohmann::json::object();
    for (const auto& [key, value] : fields.items()) {
        ops[key] = {{"assign", value}};
    }
    return {{"fields", std::move(ops)}};
}

std::string VespaIndexSink::user_id_of(const std::string& vespa_id) {
    const auto pos = vespa_id.find("::");
    return pos == std::string::npos ? vespa_id : vespa_id.substr(pos + 2);
}

VespaIndexSink::Response VespaIndexSink::send(const std::string& method,
                                              const std::string& path,
                                              const std::string& body) const {
    httplib::Client client(base_.scheme_host_port());
    client.set_connection_timeout(config_.timeout);
    client.set_read_timeout(config_.timeout);
    client.set_write_timeout(config_.timeout);

    httplib::Headers headers;
    if (!config_.auth_header.empty()) {
        headers.emplace("Authorization", config_.auth_header);
    }

    httplib::Result res;
    if (method == "POST") {
        res = client.Post(path, headers, body, kJsonContentType);
    } else if (method == "PUT") {
        res = client.Put(path, headers, body, kJsonContentType);
    } else if (method == "DELETE") {
        res = client.Delete(path, headers);
    } else {
        res = client.Get(path, headers);
    }

    Response out;
    if (!res) {
        out.error = httplib::to_string(res.error());
        return out;
    }
    out.status = res->status;
    out.body = res->body;
    return out;
}

void VespaIndexSink::fail(const std::string& what, const std::string& doc_id, const Response& r) const {
    if (r.status == 0) {
        throw IndexError(std::format("{} {} failed: {}", what, doc_id, r.error));
    }
    throw IndexError(std::format("{} {} rejected (HTTP {}): {}",
        what, doc_id, r.status, r.body.substr(0, kMaxErrorBody)));
}

void VespaIndexSink::upsert(const std::string& doc_id, const nlohmann::json& fields, DocumentKind kind) {
    const nlohmann::json body = {{"fields", fields}};
    const auto r = send("POST", document_path(doc_id, kind), encode_json(body));
    if (r.status != 200) fail("upsert", doc_id, r);
}

void VespaIndexSink::update(const std::string& doc_id, const nlohmann::json& fields) {
    const auto r = send("PUT", document_path(doc_id), encode_json(assign_body(fields)));
    if (r.status != 200) fail("update", doc_id, r);
}

void VespaIndexSink::remove(const std::string& doc_id) {
    const auto r = send("DELETE", document_path(doc_id), "");
    if (r.status != 200 && r.status != 404) fail("delete", doc_id, r);
}

std::vector<std::string> VespaIndexSink::sample_source_ids(const std::string& table, size_t limit) {
    std::vector<std::string> ids;
    const auto selection = std::format("{}.source_table==\"{}\"", config_.document_type, selection_literal(table));
    const auto prefix = table + ":";
    std::string continuation;

    while (ids.size() < limit) {
        auto path = std::format("{}/document/v1/{}/{}/docid?selection={}&wantedDocumentCount={}&fieldSet=%5Bid%5D",
            base_.path, config_.document_namespace, config_.document_type,
            utils::url_encode(selection), limit - ids.size());
        if (!continuation.empty()) {
            path += "&continuation=" + utils::url_encode(continuation);
        }

        const auto r = send("GET", path, "");
        if (r.status != 200) fail("visit", table, r);

        const auto doc = nlohmann::json::parse(r.body, nullptr, false);
        if (doc.is_discarded()) {
            throw IndexError(std::format("visit of {} returned malformed JSON", table));
        }
        for (const auto& d : doc.value("documents", nlohmann::json::array())) {
            const auto user_id = user_id_of(d.value("id", ""));
            if (user_id.starts_with(prefix) && ids.size() < limit) {
                ids.push_back(user_id.substr(prefix.size()));
            }
        }

        continuation = doc.value("continuation", "");
        if (continuation.empty()) break;
    }
    return ids;
}

} // namespace dbsync
