#pragma once

#include "core/column_type.hpp"
#include "core/error.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dbsync {

// ============================================================================
// Schema Types
// ============================================================================

struct Column {
    std::string name;
    std::string data_type;              // information_schema data_type ("integer", "ARRAY", ...)
    std::string udt_name;               // underlying type ("int4", "_text", ...)
    ColumnTypeInfo type_info;
    bool nullable = true;
    std::optional<std::string> default_value;
    std::optional<int64_t> max_length;

    Column() = default;
    Column(std::string n, std::string dt, ColumnTypeInfo ti, bool null_ok = true)
        : name(std::move(n)), data_type(std::move(dt)), type_info(std::move(ti)), nullable(null_ok) {}
};

enum class FileReferenceType {
    DIRECT_KEY,     // Storage key or path in a plain string column
    SIGNED_URL,     // Pre-authorized http(s) URL
    KEY_VALUE_MAP   // JSON object of name -> storage key
};

[[nodiscard]] inline const char* file_reference_type_to_string(FileReferenceType t) {
    switch (t) {
        case FileReferenceType::DIRECT_KEY: return "direct_key";
        case FileReferenceType::SIGNED_URL: return "signed_url";
        case FileReferenceType::KEY_VALUE_MAP: return "key_value_map";
        default: return "direct_key";
    }
}

[[nodiscard]] inline std::optional<FileReferenceType> file_reference_type_from_string(const std::string& s) {
    if (s == "direct_key") return FileReferenceType::DIRECT_KEY;
    if (s == "signed_url") return FileReferenceType::SIGNED_URL;
    if (s == "key_value_map") return FileReferenceType::KEY_VALUE_MAP;
    return std::nullopt;
}

struct FileReferenceColumn {
    std::string column;
    FileReferenceType type = FileReferenceType::DIRECT_KEY;
    std::string pattern;                // Name pattern that matched

    FileReferenceColumn() = default;
    FileReferenceColumn(std::string c, FileReferenceType t, std::string p)
        : column(std::move(c)), type(t), pattern(std::move(p)) {}
};

struct Table {
    std::string name;
    int64_t row_estimate = 0;
    std::vector<Column> columns;
    std::string primary_key;                            // Row-id column
    std::vector<std::string> watermark_columns;         // Best candidate first
    std::vector<FileReferenceColumn> file_reference_columns;
    std::optional<std::string> discovery_error;         // Set when introspection failed

    [[nodiscard]] bool has_error() const { return discovery_error.has_value(); }

    [[nodiscard]] const Column* find_column(const std::string& col) const {
        for (const auto& c : columns) {
            if (c.name == col) return &c;
        }
        return nullptr;
    }

    [[nodiscard]] const FileReferenceColumn* find_file_column(const std::string& col) const {
        for (const auto& f : file_reference_columns) {
            if (f.column == col) return &f;
        }
        return nullptr;
    }

    [[nodiscard]] std::optional<std::string> watermark_column() const {
        if (watermark_columns.empty()) return std::nullopt;
        return watermark_columns.front();
    }
};

struct ImplicitRelationship {
    std::string source_table;
    std::string source_column;
    std::string target_table;
    std::string target_column = "id";
    std::string cardinality = "many_to_one";

    ImplicitRelationship() = default;
    ImplicitRelationship(std::string st, std::string sc, std::string tt)
        : source_table(std::move(st)), source_column(std::move(sc)), target_table(std::move(tt)) {}

    bool operator==(const ImplicitRelationship&) const = default;
};

/**
 * @brief Immutable discovery snapshot
 *
 * Shared as shared_ptr<const SchemaMap>; a new discovery produces a new map.
 */
struct SchemaMap {
    std::chrono::system_clock::time_point discovery_timestamp;
    std::string database_name;
    std::vector<Table> tables;
    std::vector<ImplicitRelationship> relationships;

    [[nodiscard]] const Table* find_table(const std::string& name) const {
        for (const auto& t : tables) {
            if (t.name == name) return &t;
        }
        return nullptr;
    }

    [[nodiscard]] std::vector<const ImplicitRelationship*> relationships_from(const std::string& table) const {
        std::vector<const ImplicitRelationship*> out;
        for (const auto& r : relationships) {
            if (r.source_table == table) out.push_back(&r);
        }
        return out;
    }

    [[nodiscard]] std::vector<const ImplicitRelationship*> relationships_to(const std::string& table) const {
        std::vector<const ImplicitRelationship*> out;
        for (const auto& r : relationships) {
            if (r.target_table == table) out.push_back(&r);
        }
        return out;
    }
};

// ============================================================================
// Row Types
// ============================================================================

/**
 * @brief One column value of a source row
 *
 * The text is the source's wire representation; nullopt is SQL NULL.
 * type is the tag the transformer dispatches on.
 */
struct SourceField {
    std::string name;
    ColumnTypeInfo type;
    std::optional<std::string> text;

    SourceField() = default;
    SourceField(std::string n, ColumnTypeInfo t, std::optional<std::string> v)
        : name(std::move(n)), type(std::move(t)), text(std::move(v)) {}
};

// Ordered, column order as declared by the source
struct SourceRow {
    std::vector<SourceField> fields;

    [[nodiscard]] const SourceField* find(const std::string& name) const {
        for (const auto& f : fields) {
            if (f.name == name) return &f;
        }
        return nullptr;
    }

    [[nodiscard]] std::optional<std::string> value(const std::string& name) const {
        const auto* f = find(name);
        return f ? f->text : std::nullopt;
    }
};

// ============================================================================
// File Types
// ============================================================================

enum class DownloadStatus {
    PENDING,
    SUCCESS,
    SKIPPED,
    FAILED
};

[[nodiscard]] inline const char* download_status_to_string(DownloadStatus s) {
    switch (s) {
        case DownloadStatus::PENDING: return "pending";
        case DownloadStatus::SUCCESS: return "success";
        case DownloadStatus::SKIPPED: return "skipped";
        case DownloadStatus::FAILED: return "failed";
        default: return "pending";
    }
}

struct DetectedFile {
    std::string locator;                    // Storage key, or the URL for SIGNED_URL
    std::optional<std::string> url;         // Pre-authorized locator when present
    std::string table;
    std::string row_id;
    std::string column;
    std::optional<std::string> map_key;     // KEY_VALUE_MAP provenance
    std::string filename;
    std::string file_type;                  // Lowercase extension
    FileReferenceType reference_type = FileReferenceType::DIRECT_KEY;
    std::optional<int64_t> declared_size;
};

struct DownloadResult {
    std::string locator;
    DownloadStatus status = DownloadStatus::PENDING;
    std::optional<std::string> local_path;
    uint64_t bytes = 0;
    std::string reason;                     // Skip or failure reason
};

// ============================================================================
// Record Types
// ============================================================================

struct RelationshipRef {
    std::string target_doc_id;
    std::string target_table;
    std::string target_id;
    std::string source_column;
    std::string relationship_type;          // source_column without "_id"
    std::string direction = "outgoing";
    std::string cardinality = "many_to_one";
};

struct IncomingRelationshipHint {
    std::string source_table;
    std::string source_column;
    std::string relationship_type;
    std::string cardinality = "one_to_many";
    std::string query_hint;
};

struct FileReference {
    std::string locator;
    std::string column;
    std::string filename;
    std::string file_type;
    std::optional<std::string> map_key;
    std::optional<std::string> url;
    DownloadStatus status = DownloadStatus::PENDING;
    std::optional<std::string> local_path;
    std::string reason;
};

struct IngestedRecord {
    std::string doc_id;                     // "<table>:<row id>"
    std::string source_table;
    std::string source_id;
    std::optional<std::string> partition_key;
    std::map<std::string, std::string> metadata;   // Sorted keys, NULLs omitted
    std::vector<RelationshipRef> relationships;
    std::vector<IncomingRelationshipHint> incoming_relationships;
    std::vector<FileReference> file_references;
    std::string content_text;
    std::optional<std::string> table_description;
    std::map<std::string, std::string> column_types;
    std::optional<std::string> source_modified_at;  // Canonical watermark value
    std::optional<std::string> created_at;
    int64_t ingested_at = 0;                // Epoch milliseconds
    size_t relationships_skipped = 0;       // Null foreign keys on this row
};

[[nodiscard]] inline std::string make_doc_id(const std::string& table, const std::string& row_id) {
    return table + ":" + row_id;
}

// ============================================================================
// Checkpoint Types
// ============================================================================

enum class SyncMode {
    FULL,
    INCREMENTAL,
    SCHEMA_DISCOVERY
};

[[nodiscard]] inline const char* sync_mode_to_string(SyncMode m) {
    switch (m) {
        case SyncMode::FULL: return "full";
        case SyncMode::INCREMENTAL: return "incremental";
        case SyncMode::SCHEMA_DISCOVERY: return "schema_discovery";
        default: return "full";
    }
}

[[nodiscard]] inline std::optional<SyncMode> sync_mode_from_string(const std::string& s) {
    if (s == "full") return SyncMode::FULL;
    if (s == "incremental") return SyncMode::INCREMENTAL;
    if (s == "schema_discovery") return SyncMode::SCHEMA_DISCOVERY;
    return std::nullopt;
}

enum class CheckpointStatus {
    IDLE,
    RUNNING,
    COMPLETED,
    FAILED
};

[[nodiscard]] inline const char* checkpoint_status_to_string(CheckpointStatus s) {
    switch (s) {
        case CheckpointStatus::IDLE: return "idle";
        case CheckpointStatus::RUNNING: return "running";
        case CheckpointStatus::COMPLETED: return "completed";
        case CheckpointStatus::FAILED: return "failed";
        default: return "idle";
    }
}

[[nodiscard]] inline std::optional<CheckpointStatus> checkpoint_status_from_string(const std::string& s) {
    if (s == "idle") return CheckpointStatus::IDLE;
    if (s == "running") return CheckpointStatus::RUNNING;
    if (s == "completed") return CheckpointStatus::COMPLETED;
    if (s == "failed") return CheckpointStatus::FAILED;
    return std::nullopt;
}

struct Checkpoint {
    std::string table;
    std::optional<std::string> watermark;       // Canonical UTC form
    std::optional<std::string> last_row_id;     // Resume position within a running table
    SyncMode mode = SyncMode::FULL;
    int64_t rows_processed = 0;
    int64_t rows_failed = 0;
    CheckpointStatus status = CheckpointStatus::IDLE;
    std::optional<std::string> last_error;
    std::chrono::system_clock::time_point updated_at;

    Checkpoint() = default;
    explicit Checkpoint(std::string t) : table(std::move(t)) {}
};

// ============================================================================
// Job Types
// ============================================================================

enum class JobState {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED,
    CANCELLED
};

[[nodiscard]] inline const char* job_state_to_string(JobState s) {
    switch (s) {
        case JobState::PENDING: return "pending";
        case JobState::RUNNING: return "running";
        case JobState::COMPLETED: return "completed";
        case JobState::FAILED: return "failed";
        case JobState::CANCELLED: return "cancelled";
        default: return "pending";
    }
}

[[nodiscard]] inline bool is_terminal(JobState s) {
    return s == JobState::COMPLETED || s == JobState::FAILED || s == JobState::CANCELLED;
}

enum class ErrorSeverity { WARNING, ERROR };

struct SyncErrorEntry {
    std::string table;
    std::optional<std::string> row_id;
    ErrorCategory category = ErrorCategory::NONE;
    ErrorSeverity severity = ErrorSeverity::ERROR;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
};

struct TableFilter {
    std::vector<std::string> include;           // Empty = all tables
    std::vector<std::string> exclude;           // Glob patterns
};

struct TableProgress {
    std::string table;
    CheckpointStatus status = CheckpointStatus::IDLE;
    int64_t rows_processed = 0;
    int64_t rows_failed = 0;
    int64_t rows_deleted = 0;
    int64_t relationships_skipped = 0;
    int64_t files_detected = 0;
    int64_t files_downloaded = 0;
    int64_t files_skipped = 0;
    int64_t files_failed = 0;
    bool full_rescan_fallback = false;
    std::optional<std::string> watermark;
    std::optional<std::string> error;
};

struct SyncResult {
    std::string job_id;
    SyncMode mode = SyncMode::FULL;
    JobState state = JobState::PENDING;
    bool dry_run = false;
    TableFilter filter;
    std::vector<TableProgress> tables;          // Sorted by table name
    std::vector<SyncErrorEntry> errors;
    std::chrono::system_clock::time_point started_at;
    std::optional<std::chrono::system_clock::time_point> finished_at;

    [[nodiscard]] int64_t total_processed() const {
        int64_t n = 0;
        for (const auto& t : tables) n += t.rows_processed;
        return n;
    }

    [[nodiscard]] int64_t total_failed() const {
        int64_t n = 0;
        for (const auto& t : tables) n += t.rows_failed;
        return n;
    }

    [[nodiscard]] const TableProgress* find_table(const std::string& name) const {
        for (const auto& t : tables) {
            if (t.table == name) return &t;
        }
        return nullptr;
    }
};

struct SyncStatus {
    std::vector<Checkpoint> checkpoints;
    size_t tables_monitored = 0;
    int64_t total_records = 0;
    int64_t total_failed = 0;
    std::optional<std::string> current_job_id;
    std::optional<JobState> current_job_state;
};

} // namespace dbsync
