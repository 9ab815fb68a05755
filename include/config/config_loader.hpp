#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace dbsync {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads dbsync.toml into a SyncEngineConfig
 *
 * - ${VAR} in any string value is replaced by the environment variable
 *   (unset variables expand to "")
 * - include = "file.toml" or include = [...] pulls other files in; the
 *   including file wins on conflicts, arrays concatenate, depth <= 10,
 *   cycles are rejected
 * - every missing key takes its default
 * - validation problems are collected and reported together
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        SyncEngineConfig config;

        static LoadResult ok(SyncEngineConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to dbsync.toml
     * @param dry_run A dry run never writes to the index, so no endpoint is required
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path, bool dry_run = false);

    /**
     * @brief Load complete config from TOML string (includes are not resolved)
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content, bool dry_run = false);

    /**
     * @brief Every problem with config, empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const SyncEngineConfig& config, bool dry_run);

private:
    static SourceConfig extract_source(const toml::table& root);
    static RetryConfig extract_retry(const toml::table& root);
    static SyncConfig extract_sync(const toml::table& root);
    static CheckpointConfig extract_checkpoint(const toml::table& root);
    static IndexConfig extract_index(const toml::table& root);
    static DownloadsConfig extract_downloads(const toml::table& root);
    static StorageConfig extract_storage(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static void extract_tables(const toml::table& root, SyncEngineConfig& config);

    static SyncEngineConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(SyncEngineConfig config, bool dry_run);
};

} // namespace dbsync
