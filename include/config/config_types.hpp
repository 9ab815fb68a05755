#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace dbsync {

// ============================================================================
// Configuration Types (mirror the TOML sections)
// ============================================================================

struct SourceConfig {
    std::string connection_string;
    std::string schema = "public";
    size_t min_connections = 1;
    size_t max_connections = 8;
    int connection_timeout_ms = 5000;
    int query_timeout_ms = 30000;
    int idle_timeout_seconds = 300;
    int max_lifetime_seconds = 3600;    // 0 = never recycle
    std::string health_check_query = "SELECT 1";
};

struct RetryConfig {
    int max_attempts = 3;
    int initial_backoff_ms = 200;
    double backoff_multiplier = 2.0;
    int max_backoff_ms = 5000;
};

struct SyncConfig {
    size_t batch_size = 500;
    size_t table_workers = 4;
    std::vector<std::string> include;
    std::vector<std::string> exclude;
    std::vector<std::string> default_exclude = {"_prisma_migrations", "sync_events", "webhook_*"};
    std::string partition_column = "project_id";
    bool reconcile_deletes = false;
    size_t delete_sample_size = 1000;
    std::string schema_cache_path;
    size_t file_sample_size = 20;
    bool index_schema_metadata = false;
};

struct CheckpointConfig {
    std::string path = "dbsync_checkpoints.db";
};

struct IndexConfig {
    std::string endpoint = "http://localhost:8080";
    std::string document_namespace = "dbsync";
    std::string document_type = "source_record";
    std::string metadata_document_type = "schema_metadata";
    int timeout_ms = 10000;
    std::string auth_header;
};

struct DownloadsConfig {
    bool enabled = true;
    std::string directory = "downloads";
    size_t workers = 4;
    uint64_t max_file_size_bytes = 100ULL * 1024 * 1024;
    std::vector<std::string> supported_types = {"pdf", "jpg", "jpeg", "png", "gif", "tiff"};
    int max_attempts = 3;
    int initial_backoff_ms = 500;
    int timeout_ms = 300000;
    std::string strategy = "presigned_url";
};

struct StorageConfig {
    std::string bucket;
    std::string region = "us-east-1";
    std::string endpoint;               // Empty = AWS regional endpoint
    std::string access_key_id;
    std::string secret_access_key;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

// ============================================================================
// SyncEngineConfig - Complete parsed configuration
// ============================================================================

struct SyncEngineConfig {
    SourceConfig source;
    RetryConfig retry;
    SyncConfig sync;
    CheckpointConfig checkpoint;
    IndexConfig index;
    DownloadsConfig downloads;
    StorageConfig storage;
    LoggingConfig logging;

    // Table -> ordered columns forming the searchable text
    std::map<std::string, std::vector<std::string>> content_fields;
    // Table -> description attached to each of its records
    std::map<std::string, std::string> table_descriptions;
};

} // namespace dbsync
