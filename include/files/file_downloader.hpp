#pragma once

#include "core/retry_policy.hpp"
#include "core/types.hpp"
#include "files/iobject_store.hpp"

#include <memory>
#include <optional>
#include <set>
#include <stop_token>
#include <string>

namespace dbsync {

enum class DownloadStrategy {
    PRESIGNED_URL,      // Prefer the URL supplied by the source record
    DIRECT_STORAGE      // Prefer a signed fetch by storage key
};

[[nodiscard]] inline std::optional<DownloadStrategy> download_strategy_from_string(const std::string& s) {
    if (s == "presigned_url") return DownloadStrategy::PRESIGNED_URL;
    if (s == "direct_storage") return DownloadStrategy::DIRECT_STORAGE;
    return std::nullopt;
}

struct DownloadPolicy {
    std::set<std::string> supported_types = {"pdf", "jpg", "jpeg", "png", "gif", "tiff"};
    uint64_t max_file_size = 100ULL * 1024 * 1024;
};

/**
 * @brief Fetches one DetectedFile to <directory>/<table>/<row id>/<column>[/<map key>]/<filename>
 *
 * Never throws for a per-file problem: every outcome is a DownloadResult.
 * - skip policy (type, declared size, Content-Length) -> SKIPPED
 * - not found / forbidden -> FAILED immediately
 * - transient failures -> retried per RetryPolicy, then FAILED
 * - stop requested before or during a backoff -> SKIPPED ("cancelled")
 */
class FileDownloader {
public:
    FileDownloader(std::string directory,
                   DownloadPolicy policy,
                   RetryPolicy retry,
                   DownloadStrategy strategy,
                   std::shared_ptr<IObjectStore> url_store,
                   std::shared_ptr<IObjectStore> storage_store);

    [[nodiscard]] DownloadResult download(const DetectedFile& file, std::stop_token st = {}) const;

    // Reason to skip before fetching, nullopt to proceed
    [[nodiscard]] std::optional<std::string> skip_reason(const DetectedFile& file) const;

    [[nodiscard]] std::string local_path_for(const DetectedFile& file) const;

    [[nodiscard]] const DownloadPolicy& policy() const { return policy_; }

private:
    struct Route {
        IObjectStore* store = nullptr;
        std::string locator;
    };
    [[nodiscard]] std::optional<Route> route_for(const DetectedFile& file) const;

    std::string directory_;
    DownloadPolicy policy_;
    RetryPolicy retry_;
    DownloadStrategy strategy_;
    std::shared_ptr<IObjectStore> url_store_;
    std::shared_ptr<IObjectStore> storage_store_;
};

} // namespace dbsync
