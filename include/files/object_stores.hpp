#pragma once

#include "files/iobject_store.hpp"

#include <chrono>
#include <map>
#include <string>

namespace dbsync {

/**
 * @brief Fetches pre-authorized (signed) http(s) URLs; no credentials
 */
class HttpObjectStore : public IObjectStore {
public:
    explicit HttpObjectStore(std::chrono::milliseconds timeout = std::chrono::milliseconds{300000});

    [[nodiscard]] FetchResult fetch(const std::string& locator,
                                    std::ostream& out,
                                    uint64_t max_bytes) override;

    [[nodiscard]] std::string name() const override { return "http"; }

private:
    std::chrono::milliseconds timeout_;
};

struct StorageCredentials {
    std::string bucket;
    std::string region = "us-east-1";
    std::string endpoint;               // Empty = https://s3.<region>.amazonaws.com
    std::string access_key_id;
    std::string secret_access_key;
};

/**
 * @brief Direct object-storage fetch by key, signed with AWS Signature V4
 *
 * Path-style addressing: GET <endpoint>/<bucket>/<key>.
 */
class S3ObjectStore : public IObjectStore {
public:
    S3ObjectStore(StorageCredentials credentials,
                  std::chrono::milliseconds timeout = std::chrono::milliseconds{300000});

    [[nodiscard]] FetchResult fetch(const std::string& locator,
                                    std::ostream& out,
                                    uint64_t max_bytes) override;

    [[nodiscard]] std::string name() const override { return "s3:" + credentials_.bucket; }

    // SHA-256 of the empty payload (every GET)
    static constexpr const char* kEmptyPayloadHash =
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

    /**
     * @brief Authorization header value for one request
     *
     * headers must hold lowercase names and already include host,
     * x-amz-content-sha256 and x-amz-date (YYYYMMDDTHHMMSSZ).
     */
    [[nodiscard]] static std::string authorization_header(const StorageCredentials& credentials,
                                                          const std::string& method,
                                                          const std::string& canonical_uri,
                                                          const std::string& canonical_query,
                                                          const std::map<std::string, std::string>& headers,
                                                          const std::string& payload_hash);

    [[nodiscard]] static std::string sha256_hex(const std::string& data);
    [[nodiscard]] static std::string hmac_sha256_raw(const std::string& key, const std::string& data);

    // "/<bucket>/<percent-encoded key>"
    [[nodiscard]] std::string object_path(const std::string& key) const;

private:
    StorageCredentials credentials_;
    std::chrono::milliseconds timeout_;
    std::string endpoint_;
};

} // namespace dbsync
