#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace dbsync {

enum class FetchStatus {
    OK,
    NOT_FOUND,
    FORBIDDEN,
    TOO_LARGE,      // Content-Length or streamed bytes over the ceiling
    ERROR
};

[[nodiscard]] inline const char* fetch_status_to_string(FetchStatus s) {
    switch (s) {
        case FetchStatus::OK: return "ok";
        case FetchStatus::NOT_FOUND: return "not_found";
        case FetchStatus::FORBIDDEN: return "forbidden";
        case FetchStatus::TOO_LARGE: return "too_large";
        case FetchStatus::ERROR: return "error";
        default: return "error";
    }
}

struct FetchResult {
    FetchStatus status = FetchStatus::ERROR;
    uint64_t bytes = 0;
    std::optional<uint64_t> content_length;
    std::string error;
    bool transient = false;     // Network failure, timeout, 5xx, 429

    [[nodiscard]] bool ok() const { return status == FetchStatus::OK; }
};

/**
 * @brief Object/asset store
 *
 * fetch() streams the object into out. Writing stops with TOO_LARGE as soon
 * as the reported or streamed size exceeds max_bytes.
 */
class IObjectStore {
public:
    virtual ~IObjectStore() = default;

    [[nodiscard]] virtual FetchResult fetch(const std::string& locator,
                                            std::ostream& out,
                                            uint64_t max_bytes) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace dbsync
