#include "files/reference_shape.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <regex>

namespace dbsync::files {

namespace {

constexpr size_t kMaxLocatorLength = 2048;

const std::regex& url_regex() {
    static const std::regex re(R"(^https?://[A-Za-z0-9.\-]+(:[0-9]+)?(/[^\s]*)?$)",
                               std::regex::icase);
    return re;
}

} // namespace

bool is_path_like(std::string_view value) {
    if (value.empty() || value.size() > kMaxLocatorLength) return false;
    if (value.find("://") != std::string_view::npos) return false;
    if (value.front() == '{' || value.front() == '[') return false;
    for (const char c : value) {
        if (c == '\n' || c == '\r' || c == '\t') return false;
    }
    // Either a nested key or at least a file name with an extension
    if (value.find('/') != std::string_view::npos) {
        return !utils::last_path_segment(value).empty();
    }
    return !utils::file_extension(value).empty();
}

bool is_url_like(std::string_view value) {
    if (value.empty() || value.size() > kMaxLocatorLength) return false;
    return std::regex_match(value.begin(), value.end(), url_regex());
}

std::optional<std::vector<std::pair<std::string, std::string>>>
parse_key_map(std::string_view json_text) {
    // ordered_json keeps the source key order for provenance
    const auto doc = nlohmann::ordered_json::parse(json_text.begin(), json_text.end(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) return std::nullopt;

    std::vector<std::pair<std::string, std::string>> entries;
    entries.reserve(doc.size());
    for (const auto& [key, value] : doc.items()) {
        if (!value.is_string()) return std::nullopt;
        const auto& locator = value.get_ref<const std::string&>();
        if (!is_path_like(locator)) return std::nullopt;
        entries.emplace_back(key, locator);
    }
    return entries;
}

} // namespace dbsync::files
