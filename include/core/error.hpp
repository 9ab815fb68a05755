#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace dbsync {

/**
 * @brief Error categories for the sync engine
 *
 * The category decides the isolation boundary:
 * - CONNECTION_ERROR: run-fatal after retries are exhausted
 * - QUERY_ERROR, CHECKPOINT_ERROR: abort the current table only
 * - SCHEMA_ERROR: isolated to one table during discovery
 * - TRANSFORM_ERROR, INDEX_ERROR: isolated to one row
 * - DOWNLOAD_ERROR: isolated to one file reference
 */
enum class ErrorCategory {
    NONE,
    CONNECTION_ERROR,
    SCHEMA_ERROR,
    TRANSFORM_ERROR,
    INDEX_ERROR,
    DOWNLOAD_ERROR,
    QUERY_ERROR,
    CHECKPOINT_ERROR,
    CONFIG_ERROR,
    CANCELLED,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "none";
        case ErrorCategory::CONNECTION_ERROR: return "connection";
        case ErrorCategory::SCHEMA_ERROR: return "schema";
        case ErrorCategory::TRANSFORM_ERROR: return "transform";
        case ErrorCategory::INDEX_ERROR: return "index";
        case ErrorCategory::DOWNLOAD_ERROR: return "download";
        case ErrorCategory::QUERY_ERROR: return "query";
        case ErrorCategory::CHECKPOINT_ERROR: return "checkpoint";
        case ErrorCategory::CONFIG_ERROR: return "config";
        case ErrorCategory::CANCELLED: return "cancelled";
        case ErrorCategory::INTERNAL_ERROR: return "internal";
        default: return "unknown";
    }
}

/**
 * @brief Base exception carrying an ErrorCategory
 */
class SyncError : public std::runtime_error {
public:
    SyncError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

// Source unreachable or authentication failure
class ConnectionError : public SyncError {
public:
    explicit ConnectionError(const std::string& message)
        : SyncError(ErrorCategory::CONNECTION_ERROR, message) {}
};

// Catalog introspection failed for one table
class SchemaError : public SyncError {
public:
    explicit SchemaError(const std::string& message)
        : SyncError(ErrorCategory::SCHEMA_ERROR, message) {}
};

// A single row could not be serialized
class TransformError : public SyncError {
public:
    explicit TransformError(const std::string& message)
        : SyncError(ErrorCategory::TRANSFORM_ERROR, message) {}
};

// The downstream index rejected a write
class IndexError : public SyncError {
public:
    explicit IndexError(const std::string& message)
        : SyncError(ErrorCategory::INDEX_ERROR, message) {}
};

// An asset fetch failed
class DownloadError : public SyncError {
public:
    explicit DownloadError(const std::string& message)
        : SyncError(ErrorCategory::DOWNLOAD_ERROR, message) {}
};

// A source query failed while the connection stayed usable
class QueryError : public SyncError {
public:
    explicit QueryError(const std::string& message)
        : SyncError(ErrorCategory::QUERY_ERROR, message) {}
};

class CheckpointError : public SyncError {
public:
    explicit CheckpointError(const std::string& message)
        : SyncError(ErrorCategory::CHECKPOINT_ERROR, message) {}
};

class CancelledError : public SyncError {
public:
    explicit CancelledError(const std::string& message = "operation cancelled")
        : SyncError(ErrorCategory::CANCELLED, message) {}
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace dbsync
