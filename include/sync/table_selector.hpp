#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace dbsync {

/**
 * @brief Applies a run's include/exclude filter to the discovered tables
 *
 * - a non-empty include list limits the run to those names
 * - exclude globs always win
 * - default exclusions (migrations, event logs) apply unless the table is
 *   named explicitly in the include list
 */
class TableSelector {
public:
    static const std::vector<std::string>& builtin_default_excludes();

    TableSelector(TableFilter filter, std::vector<std::string> default_excludes);

    [[nodiscard]] bool includes(const std::string& table) const;

    // Selected table names in name order
    [[nodiscard]] std::vector<std::string> select(const SchemaMap& schema) const;

    [[nodiscard]] const TableFilter& filter() const { return filter_; }

private:
    TableFilter filter_;
    std::vector<std::string> default_excludes_;
};

} // namespace dbsync
