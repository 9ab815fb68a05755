#include "files/file_downloader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <fstream>

namespace dbsync {

namespace fs = std::filesystem;

namespace {

DownloadResult make_result(const DetectedFile& file, DownloadStatus status, std::string reason = {}) {
    DownloadResult r;
    r.locator = file.locator;
    r.status = status;
    r.reason = std::move(reason);
    return r;
}

std::string safe_segment(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const char c : s) {
        out += (c == '/' || c == '\\' || c == '\0') ? '_' : c;
    }
    if (out.empty() || out == "." || out == "..") return "_";
    return out;
}

} // namespace

FileDownloader::FileDownloader(std::string directory,
                               DownloadPolicy policy,
                               RetryPolicy retry,
                               DownloadStrategy strategy,
                               std::shared_ptr<IObjectStore> url_store,
                               std::shared_ptr<IObjectStore> storage_store)
    : directory_(std::move(directory)),
      policy_(std::move(policy)),
      retry_(std::move(retry)),
      strategy_(strategy),
      url_store_(std::move(url_store)),
      storage_store_(std::move(storage_store)) {
    retry_.retryable = [](const std::exception& e) {
        return dynamic_cast<const DownloadError*>(&e) != nullptr;
    };
}

std::optional<std::string> FileDownloader::skip_reason(const DetectedFile& file) const {
    if (file.declared_size && *file.declared_size > 0 &&
        static_cast<uint64_t>(*file.declared_size) > policy_.max_file_size) {
        return std::format("file too large: {} bytes", *file.declared_size);
    }
    if (!policy_.supported_types.contains(file.file_type)) {
        return file.file_type.empty()
            ? std::string("unsupported file type: <none>")
            : std::format("unsupported file type: {}", file.file_type);
    }
    return std::nullopt;
}

std::string FileDownloader::local_path_for(const DetectedFile& file) const {
    const auto filename = file.filename.empty()
        ? std::format("{}_{}", file.table, file.row_id)
        : file.filename;
    // One directory per reference, so same-named files of one row never share a path
    auto dir = fs::path(directory_) / safe_segment(file.table) / safe_segment(file.row_id) /
               safe_segment(file.column);
    if (file.map_key) dir /= safe_segment(*file.map_key);
    return (dir / safe_segment(filename)).string();
}

std::optional<FileDownloader::Route> FileDownloader::route_for(const DetectedFile& file) const {
    const bool has_url = file.url.has_value() && url_store_;
    const bool has_key = file.reference_type != FileReferenceType::SIGNED_URL && storage_store_;

    if (has_url && (strategy_ == DownloadStrategy::PRESIGNED_URL || !has_key)) {
        return Route{url_store_.get(), *file.url};
    }
    if (has_key) {
        return Route{storage_store_.get(), file.locator};
    }
    return std::nullopt;
}

DownloadResult FileDownloader::download(const DetectedFile& file, std::stop_token st) const {
    if (auto reason = skip_reason(file)) {
        utils::log::debug(std::format("Skipping {} ({}.{} row {}): {}",
            file.locator, file.table, file.column, file.row_id, *reason));
        return make_result(file, DownloadStatus::SKIPPED, std::move(*reason));
    }
    if (st.stop_requested()) {
        return make_result(file, DownloadStatus::SKIPPED, "cancelled");
    }

    const auto route = route_for(file);
    if (!route) {
        auto r = make_result(file, DownloadStatus::FAILED, "no pre-authorized URL and no storage credentials");
        utils::log::warn(std::format("Download of {} failed: {}", file.locator, r.reason));
        return r;
    }

    const auto path = local_path_for(file);
    const auto tmp = path + ".part";
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        return make_result(file, DownloadStatus::FAILED,
            std::format("cannot create {}: {}", fs::path(path).parent_path().string(), ec.message()));
    }

    FetchResult fetched;
    try {
        fetched = retry_.execute([&] {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                FetchResult r;
                r.status = FetchStatus::ERROR;
                r.error = std::format("cannot open {}", tmp);
                return r;
            }
            auto r = route->store->fetch(route->locator, out, policy_.max_file_size);
            if (r.status == FetchStatus::ERROR && r.transient) {
                throw DownloadError(r.error);
            }
            return r;
        }, st, std::format("download of {}", file.locator));
    } catch (const DownloadError& e) {
        fetched.status = FetchStatus::ERROR;
        fetched.error = e.what();
    } catch (const CancelledError&) {
        fs::remove(tmp, ec);
        return make_result(file, DownloadStatus::SKIPPED, "cancelled");
    }

    if (!fetched.ok()) {
        fs::remove(tmp, ec);
        if (fetched.status == FetchStatus::TOO_LARGE) {
            utils::log::debug(std::format("Skipping {}: {}", file.locator, fetched.error));
            return make_result(file, DownloadStatus::SKIPPED, fetched.error);
        }
        const auto reason = std::format("{}: {}", fetch_status_to_string(fetched.status), fetched.error);
        utils::log::warn(std::format("Download of {} ({}.{} row {}) via {} failed: {}",
            file.locator, file.table, file.column, file.row_id, route->store->name(), reason));
        return make_result(file, DownloadStatus::FAILED, reason);
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return make_result(file, DownloadStatus::FAILED, std::format("cannot move download into {}", path));
    }

    auto result = make_result(file, DownloadStatus::SUCCESS);
    result.local_path = path;
    result.bytes = fetched.bytes;
    return result;
}

} // namespace dbsync
