#pragma once

#include "core/column_type.hpp"
#include <string>

namespace dbsync {

/**
 * @brief PostgreSQL type mapping utilities
 *
 * Maps catalog type names (information_schema data_type and udt_name)
 * to GenericColumnType.
 */
class PgTypeMap {
public:
    /**
     * @brief Map a PostgreSQL type name to GenericColumnType
     * @param type_name data_type or udt_name, any case
     * @return Generic column type, UNKNOWN when not recognized
     */
    [[nodiscard]] static GenericColumnType type_name_to_generic(const std::string& type_name);

    /**
     * @brief Build a full ColumnTypeInfo from catalog columns
     * @param data_type information_schema.columns.data_type ("ARRAY", "USER-DEFINED", ...)
     * @param udt_name information_schema.columns.udt_name ("_int4", "my_enum", ...)
     */
    [[nodiscard]] static ColumnTypeInfo build_type_info(const std::string& data_type,
                                                        const std::string& udt_name = "");
};

} // namespace dbsync
