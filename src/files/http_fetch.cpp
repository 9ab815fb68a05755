#define CPPHTTPLIB_OPENSSL_SUPPORT
#include "files/http_fetch.hpp"

#include <httplib.h>

#include <format>

namespace dbsync::detail {

namespace {

bool is_transient_status(int status) {
    return status == 429 || status >= 500;
}

} // namespace

FetchResult http_get(const utils::HttpUrl& url,
                     const std::map<std::string, std::string>& headers,
                     std::ostream& out,
                     uint64_t max_bytes,
                     std::chrono::milliseconds timeout) {
    FetchResult result;

    httplib::Client client(url.scheme_host_port());
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_follow_location(true);

    httplib::Headers request_headers;
    for (const auto& [k, v] : headers) request_headers.emplace(k, v);

    int status = 0;
    bool too_large = false;

    auto res = client.Get(url.path, request_headers,
        [&](const httplib::Response& response) {
            status = response.status;
            if (status < 200 || status >= 300) return false;
            if (response.has_header("Content-Length")) {
                const auto length = utils::try_parse_int<uint64_t>(response.get_header_value("Content-Length"));
                if (length) {
                    result.content_length = *length;
                    if (*length > max_bytes) {
                        too_large = true;
                        return false;
                    }
                }
            }
            return true;
        },
        [&](const char* data, size_t length) {
            if (result.bytes + length > max_bytes) {
                too_large = true;
                return false;
            }
            out.write(data, static_cast<std::streamsize>(length));
            result.bytes += length;
            return out.good();
        });

    if (too_large) {
        result.status = FetchStatus::TOO_LARGE;
        result.error = std::format("file too large: {} bytes (limit {})",
            result.content_length.value_or(result.bytes), max_bytes);
        return result;
    }

    if (status == 0) {
        result.status = FetchStatus::ERROR;
        result.transient = true;
        result.error = std::format("request to {} failed: {}", url.host, httplib::to_string(res.error()));
        return result;
    }

    if (status == 404) {
        result.status = FetchStatus::NOT_FOUND;
        result.error = "HTTP 404";
    } else if (status == 401 || status == 403) {
        result.status = FetchStatus::FORBIDDEN;
        result.error = std::format("HTTP {}", status);
    } else if (status < 200 || status >= 300) {
        result.status = FetchStatus::ERROR;
        result.transient = is_transient_status(status);
        result.error = std::format("HTTP {}", status);
    } else if (!res) {
        // Headers arrived but the body transfer broke off
        result.status = FetchStatus::ERROR;
        result.transient = true;
        result.error = std::format("transfer from {} failed: {}", url.host, httplib::to_string(res.error()));
    } else if (!out.good()) {
        result.status = FetchStatus::ERROR;
        result.error = "local write failed";
    } else {
        result.status = FetchStatus::OK;
    }
    return result;
}

} // namespace dbsync::detail
