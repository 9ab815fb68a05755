#pragma once

#include <string_view>

namespace dbsync::db {

// information_schema yes/no columns
inline constexpr std::string_view kYes    = "YES";
inline constexpr std::string_view kYesLow = "yes";

inline constexpr std::string_view kDefaultSchema = "public";
inline constexpr std::string_view kDefaultIdColumn = "id";

} // namespace dbsync::db
