#include "files/object_stores.hpp"
#include "files/http_fetch.hpp"
#include "core/utils.hpp"

#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <ctime>
#include <format>
#include <iomanip>
#include <sstream>

namespace dbsync {

namespace {

std::string to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

// YYYYMMDDTHHMMSSZ
std::string amz_date_now() {
    const auto t = std::chrono::system_clock::to_time_t(utils::now());
    std::tm tm_buf;
    ::gmtime_r(&t, &tm_buf);
    char buf[20];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm_buf);
    return buf;
}

} // namespace

// ============================================================================
// HttpObjectStore
// ============================================================================

HttpObjectStore::HttpObjectStore(std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

FetchResult HttpObjectStore::fetch(const std::string& locator, std::ostream& out, uint64_t max_bytes) {
    const auto url = utils::parse_http_url(locator);
    if (!url) {
        FetchResult r;
        r.status = FetchStatus::ERROR;
        r.error = "not an http(s) URL";
        return r;
    }
    return detail::http_get(*url, {}, out, max_bytes, timeout_);
}

// ============================================================================
// S3ObjectStore
// ============================================================================

S3ObjectStore::S3ObjectStore(StorageCredentials credentials, std::chrono::milliseconds timeout)
    : credentials_(std::move(credentials)), timeout_(timeout) {
    endpoint_ = credentials_.endpoint.empty()
        ? std::format("https://s3.{}.amazonaws.com", credentials_.region)
        : credentials_.endpoint;
    while (endpoint_.ends_with('/')) endpoint_.pop_back();
}

std::string S3ObjectStore::sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string S3ObjectStore::hmac_sha256_raw(const std::string& key, const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    unsigned int len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, &len);
    return {reinterpret_cast<char*>(digest), len};
}

std::string S3ObjectStore::object_path(const std::string& key) const {
    std::string trimmed = key;
    while (trimmed.starts_with('/')) trimmed.erase(0, 1);
    return "/" + utils::url_encode(credentials_.bucket) + "/" + utils::url_encode(trimmed, true);
}

std::string S3ObjectStore::authorization_header(const StorageCredentials& credentials,
                                                const std::string& method,
                                                const std::string& canonical_uri,
                                                const std::string& canonical_query,
                                                const std::map<std::string, std::string>& headers,
                                                const std::string& payload_hash) {
    static constexpr const char* kAlgorithm = "AWS4-HMAC-SHA256";
    static constexpr const char* kService = "s3";

    const auto& amz_date = headers.at("x-amz-date");
    const auto date_stamp = amz_date.substr(0, 8);

    std::string canonical_headers;
    std::string signed_headers;
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        canonical_headers += it->first + ":" + utils::trim(it->second) + "\n";
        signed_headers += it->first;
        if (std::next(it) != headers.end()) signed_headers += ";";
    }

    const auto canonical_request = std::format("{}\n{}\n{}\n{}\n{}\n{}",
        method, canonical_uri, canonical_query, canonical_headers, signed_headers, payload_hash);

    const auto scope = std::format("{}/{}/{}/aws4_request", date_stamp, credentials.region, kService);
    const auto string_to_sign = std::format("{}\n{}\n{}\n{}",
        kAlgorithm, amz_date, scope, sha256_hex(canonical_request));

    const auto k_date = hmac_sha256_raw("AWS4" + credentials.secret_access_key, date_stamp);
    const auto k_region = hmac_sha256_raw(k_date, credentials.region);
    const auto k_service = hmac_sha256_raw(k_region, kService);
    const auto k_signing = hmac_sha256_raw(k_service, "aws4_request");
    const auto signature_raw = hmac_sha256_raw(k_signing, string_to_sign);
    const auto signature = to_hex(reinterpret_cast<const unsigned char*>(signature_raw.data()),
                                  signature_raw.size());

    return std::format("{} Credential={}/{}, SignedHeaders={}, Signature={}",
        kAlgorithm, credentials.access_key_id, scope, signed_headers, signature);
}

FetchResult S3ObjectStore::fetch(const std::string& locator, std::ostream& out, uint64_t max_bytes) {
    auto url = utils::parse_http_url(endpoint_);
    if (!url) {
        FetchResult r;
        r.status = FetchStatus::ERROR;
        r.error = std::format("invalid storage endpoint '{}'", endpoint_);
        return r;
    }
    url->path = object_path(locator);

    const bool default_port = (url->use_ssl && url->port == 443) || (!url->use_ssl && url->port == 80);
    std::map<std::string, std::string> headers = {
        {"host", default_port ? url->host : std::format("{}:{}", url->host, url->port)},
        {"x-amz-content-sha256", kEmptyPayloadHash},
        {"x-amz-date", amz_date_now()},
    };
    const auto auth = authorization_header(credentials_, "GET", url->path, "", headers, kEmptyPayloadHash);

    // httplib sets Host itself
    headers.erase("host");
    headers.emplace("Authorization", auth);
    return detail::http_get(*url, headers, out, max_bytes, timeout_);
}

} // namespace dbsync
