#include "files/file_detector.hpp"
#include "files/reference_shape.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <set>

namespace dbsync {

namespace {

constexpr std::string_view kKeySuffixes[] = {"_s3_key", "_file_key", "_file_path", "_key", "_path"};

DetectedFile make_file(const std::string& table, const std::string& row_id,
                       const std::string& column, std::string locator,
                       FileReferenceType type) {
    DetectedFile f;
    f.filename = utils::last_path_segment(locator);
    f.file_type = utils::file_extension(f.filename);
    f.locator = std::move(locator);
    f.table = table;
    f.row_id = row_id;
    f.column = column;
    f.reference_type = type;
    return f;
}

std::optional<int64_t> declared_size_of(const SourceRow& row) {
    const auto value = row.value(FileDetector::kFileSizeColumn);
    if (!value) return std::nullopt;
    return utils::try_parse_int<int64_t>(utils::trim(*value));
}

} // namespace

std::vector<std::string> FileDetector::companion_url_columns(const std::string& column) {
    std::vector<std::string> out;
    for (const auto suffix : kKeySuffixes) {
        if (column.size() > suffix.size() && column.ends_with(suffix)) {
            out.push_back(column.substr(0, column.size() - suffix.size()) + "_url");
            break;
        }
    }
    out.emplace_back("url");
    return out;
}

std::optional<DetectedFile> FileDetector::parse_direct_key(
    const std::string& table, const std::string& row_id,
    const std::string& column, const std::string& value) {
    auto locator = utils::trim(value);
    if (locator.empty()) return std::nullopt;
    if (!files::is_path_like(locator)) {
        utils::log::debug(std::format("{}.{} (row {}): '{}' does not look like a storage key",
            table, column, row_id, locator));
    }
    return make_file(table, row_id, column, std::move(locator), FileReferenceType::DIRECT_KEY);
}

std::vector<DetectedFile> FileDetector::parse_key_map(
    const std::string& table, const std::string& row_id,
    const std::string& column, const std::string& value) {
    const auto doc = nlohmann::ordered_json::parse(value, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw TransformError(std::format("{}.{} is not a JSON object", table, column));
    }

    std::vector<DetectedFile> out;
    for (const auto& [key, entry] : doc.items()) {
        if (!entry.is_string()) continue;
        auto locator = utils::trim(entry.get<std::string>());
        if (locator.empty()) continue;
        auto& f = out.emplace_back(make_file(table, row_id, column, std::move(locator),
                                             FileReferenceType::KEY_VALUE_MAP));
        f.map_key = key;
    }
    return out;
}

std::optional<DetectedFile> FileDetector::parse_url(
    const std::string& table, const std::string& row_id,
    const std::string& column, const std::string& value) {
    auto url = utils::trim(value);
    if (!files::is_url_like(url)) return std::nullopt;

    auto f = make_file(table, row_id, column, url, FileReferenceType::SIGNED_URL);
    f.url = std::move(url);
    return f;
}

DetectionOutcome FileDetector::detect(const Table& table,
                                      const SourceRow& row,
                                      const std::string& row_id) {
    DetectionOutcome outcome;
    std::set<std::string> consumed_urls;

    // Direct keys and maps first so their companion URL columns can be claimed
    for (const auto& fc : table.file_reference_columns) {
        if (fc.type == FileReferenceType::SIGNED_URL) continue;
        const auto value = row.value(fc.column);
        if (!value) continue;

        if (fc.type == FileReferenceType::DIRECT_KEY) {
            auto f = parse_direct_key(table.name, row_id, fc.column, *value);
            if (!f) continue;
            for (const auto& companion : companion_url_columns(fc.column)) {
                const auto url = row.value(companion);
                if (url && files::is_url_like(utils::trim(*url))) {
                    f->url = utils::trim(*url);
                    consumed_urls.insert(companion);
                    break;
                }
            }
            outcome.files.push_back(std::move(*f));
        } else {
            try {
                auto found = parse_key_map(table.name, row_id, fc.column, *value);
                for (auto& f : found) outcome.files.push_back(std::move(f));
            } catch (const TransformError& e) {
                outcome.malformed.emplace_back(e.what());
            }
        }
    }

    for (const auto& fc : table.file_reference_columns) {
        if (fc.type != FileReferenceType::SIGNED_URL || consumed_urls.contains(fc.column)) continue;
        const auto value = row.value(fc.column);
        if (!value || utils::trim(*value).empty()) continue;

        if (auto f = parse_url(table.name, row_id, fc.column, *value)) {
            outcome.files.push_back(std::move(*f));
        } else {
            outcome.malformed.push_back(std::format("{}.{} is not a valid URL", table.name, fc.column));
        }
    }

    if (const auto size = declared_size_of(row)) {
        for (auto& f : outcome.files) f.declared_size = *size;
    }

    for (const auto& msg : outcome.malformed) {
        utils::log::warn(std::format("Skipping file reference in {} row {}: {}", table.name, row_id, msg));
    }
    return outcome;
}

} // namespace dbsync
