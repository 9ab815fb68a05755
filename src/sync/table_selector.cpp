#include "sync/table_selector.hpp"
#include "core/utils.hpp"

#include <algorithm>

namespace dbsync {

namespace {

bool matches_any(const std::vector<std::string>& patterns, const std::string& table) {
    return std::any_of(patterns.begin(), patterns.end(),
        [&table](const std::string& p) { return utils::glob_match(p, table); });
}

} // namespace

const std::vector<std::string>& TableSelector::builtin_default_excludes() {
    static const std::vector<std::string> defaults = {"_prisma_migrations", "sync_events", "webhook_*"};
    return defaults;
}

TableSelector::TableSelector(TableFilter filter, std::vector<std::string> default_excludes)
    : filter_(std::move(filter)), default_excludes_(std::move(default_excludes)) {}

bool TableSelector::includes(const std::string& table) const {
    if (matches_any(filter_.exclude, table)) return false;

    if (!filter_.include.empty()) {
        return std::find(filter_.include.begin(), filter_.include.end(), table) != filter_.include.end();
    }
    return !matches_any(default_excludes_, table);
}

std::vector<std::string> TableSelector::select(const SchemaMap& schema) const {
    std::vector<std::string> out;
    for (const auto& t : schema.tables) {
        if (includes(t.name)) out.push_back(t.name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace dbsync
