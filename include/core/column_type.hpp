#pragma once

#include <cstdint>
#include <string>

namespace dbsync {

/**
 * @brief Database-agnostic column type classification
 *
 * Mapped from the source's catalog type names (information_schema
 * data_type / udt_name). The Record Transformer picks its serialization
 * rule from this value.
 */
enum class GenericColumnType : uint16_t {
    UNKNOWN = 0,

    // Integer family
    SMALLINT,
    INTEGER,
    BIGINT,

    // Floating point
    REAL,
    DOUBLE_PRECISION,
    NUMERIC,

    // String family
    TEXT,
    VARCHAR,
    CHAR,

    // Boolean
    BOOLEAN,

    // Date/Time
    DATE,
    TIME,
    TIMESTAMP,
    TIMESTAMP_TZ,
    INTERVAL,

    // Binary
    BLOB,

    // JSON
    JSON,
    JSONB,

    UUID,

    // Array (element type carried separately)
    ARRAY,

    // Enum types and anything else user-defined
    VENDOR_SPECIFIC,
};

/**
 * @brief Column type carrying both the generic family and the source's names
 */
struct ColumnTypeInfo {
    GenericColumnType generic_type = GenericColumnType::UNKNOWN;
    GenericColumnType element_type = GenericColumnType::UNKNOWN;  // ARRAY only
    std::string vendor_type_name;      // "integer", "timestamp with time zone", ...

    ColumnTypeInfo() = default;
    ColumnTypeInfo(GenericColumnType gt, std::string vname)
        : generic_type(gt), vendor_type_name(std::move(vname)) {}
    ColumnTypeInfo(GenericColumnType gt, GenericColumnType et, std::string vname)
        : generic_type(gt), element_type(et), vendor_type_name(std::move(vname)) {}
};

[[nodiscard]] inline bool is_integer_type(GenericColumnType t) {
    return t == GenericColumnType::SMALLINT ||
           t == GenericColumnType::INTEGER ||
           t == GenericColumnType::BIGINT;
}

[[nodiscard]] inline bool is_float_type(GenericColumnType t) {
    return t == GenericColumnType::REAL ||
           t == GenericColumnType::DOUBLE_PRECISION ||
           t == GenericColumnType::NUMERIC;
}

[[nodiscard]] inline bool is_string_type(GenericColumnType t) {
    return t == GenericColumnType::TEXT ||
           t == GenericColumnType::VARCHAR ||
           t == GenericColumnType::CHAR;
}

[[nodiscard]] inline bool is_timestamp_type(GenericColumnType t) {
    return t == GenericColumnType::TIMESTAMP ||
           t == GenericColumnType::TIMESTAMP_TZ;
}

[[nodiscard]] inline bool is_json_type(GenericColumnType t) {
    return t == GenericColumnType::JSON ||
           t == GenericColumnType::JSONB;
}

[[nodiscard]] inline const char* generic_column_type_to_string(GenericColumnType type) {
    switch (type) {
        case GenericColumnType::UNKNOWN: return "UNKNOWN";
        case GenericColumnType::SMALLINT: return "SMALLINT";
        case GenericColumnType::INTEGER: return "INTEGER";
        case GenericColumnType::BIGINT: return "BIGINT";
        case GenericColumnType::REAL: return "REAL";
        case GenericColumnType::DOUBLE_PRECISION: return "DOUBLE_PRECISION";
        case GenericColumnType::NUMERIC: return "NUMERIC";
        case GenericColumnType::TEXT: return "TEXT";
        case GenericColumnType::VARCHAR: return "VARCHAR";
        case GenericColumnType::CHAR: return "CHAR";
        case GenericColumnType::BOOLEAN: return "BOOLEAN";
        case GenericColumnType::DATE: return "DATE";
        case GenericColumnType::TIME: return "TIME";
        case GenericColumnType::TIMESTAMP: return "TIMESTAMP";
        case GenericColumnType::TIMESTAMP_TZ: return "TIMESTAMP_TZ";
        case GenericColumnType::INTERVAL: return "INTERVAL";
        case GenericColumnType::BLOB: return "BLOB";
        case GenericColumnType::JSON: return "JSON";
        case GenericColumnType::JSONB: return "JSONB";
        case GenericColumnType::UUID: return "UUID";
        case GenericColumnType::ARRAY: return "ARRAY";
        case GenericColumnType::VENDOR_SPECIFIC: return "VENDOR_SPECIFIC";
        default: return "UNKNOWN";
    }
}

} // namespace dbsync
