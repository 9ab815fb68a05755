#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"
#include <unordered_map>

namespace dbsync {

GenericColumnType PgTypeMap::type_name_to_generic(const std::string& type_name) {
    static const std::unordered_map<std::string, GenericColumnType> TYPES = {
        {"integer", GenericColumnType::INTEGER},    {"int4", GenericColumnType::INTEGER},
        {"smallint", GenericColumnType::SMALLINT},  {"int2", GenericColumnType::SMALLINT},
        {"bigint", GenericColumnType::BIGINT},      {"int8", GenericColumnType::BIGINT},
        {"serial", GenericColumnType::INTEGER},     {"bigserial", GenericColumnType::BIGINT},
        {"oid", GenericColumnType::BIGINT},
        {"real", GenericColumnType::REAL},          {"float4", GenericColumnType::REAL},
        {"double precision", GenericColumnType::DOUBLE_PRECISION},
        {"float8", GenericColumnType::DOUBLE_PRECISION},
        {"numeric", GenericColumnType::NUMERIC},    {"decimal", GenericColumnType::NUMERIC},
        {"text", GenericColumnType::TEXT},
        {"citext", GenericColumnType::TEXT},
        {"varchar", GenericColumnType::VARCHAR},    {"character varying", GenericColumnType::VARCHAR},
        {"char", GenericColumnType::CHAR},          {"character", GenericColumnType::CHAR},
        {"bpchar", GenericColumnType::CHAR},        {"name", GenericColumnType::VARCHAR},
        {"boolean", GenericColumnType::BOOLEAN},    {"bool", GenericColumnType::BOOLEAN},
        {"date", GenericColumnType::DATE},
        {"time", GenericColumnType::TIME},          {"time without time zone", GenericColumnType::TIME},
        {"timetz", GenericColumnType::TIME},        {"time with time zone", GenericColumnType::TIME},
        {"timestamp", GenericColumnType::TIMESTAMP},
        {"timestamp without time zone", GenericColumnType::TIMESTAMP},
        {"timestamptz", GenericColumnType::TIMESTAMP_TZ},
        {"timestamp with time zone", GenericColumnType::TIMESTAMP_TZ},
        {"interval", GenericColumnType::INTERVAL},
        {"bytea", GenericColumnType::BLOB},
        {"json", GenericColumnType::JSON},
        {"jsonb", GenericColumnType::JSONB},
        {"uuid", GenericColumnType::UUID},
        {"array", GenericColumnType::ARRAY},
        {"user-defined", GenericColumnType::VENDOR_SPECIFIC},
    };

    const auto it = TYPES.find(utils::to_lower(type_name));
    return it != TYPES.end() ? it->second : GenericColumnType::UNKNOWN;
}

ColumnTypeInfo PgTypeMap::build_type_info(const std::string& data_type, const std::string& udt_name) {
    ColumnTypeInfo info;
    info.vendor_type_name = data_type;
    info.generic_type = type_name_to_generic(data_type);

    if (info.generic_type == GenericColumnType::ARRAY) {
        // Array udt names carry a leading underscore: _int4, _text
        std::string element = udt_name;
        if (!element.empty() && element.front() == '_') element.erase(0, 1);
        info.element_type = type_name_to_generic(element);
        if (info.element_type == GenericColumnType::UNKNOWN) {
            info.element_type = GenericColumnType::TEXT;
        }
    } else if ((info.generic_type == GenericColumnType::UNKNOWN ||
                info.generic_type == GenericColumnType::VENDOR_SPECIFIC) && !udt_name.empty()) {
        // USER-DEFINED columns: extensions like citext resolve by udt_name, enums stay vendor-specific
        const auto by_udt = type_name_to_generic(udt_name);
        info.generic_type = by_udt != GenericColumnType::UNKNOWN ? by_udt : GenericColumnType::VENDOR_SPECIFIC;
    }
    return info;
}

} // namespace dbsync
