#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "files/file_downloader.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace dbsync {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_node(toml::node& node);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        expand_env_vars_in_node(val);
    }
}

void expand_env_vars_in_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) *s = std::move(expanded);
    } else if (auto* t = node.as_table()) {
        expand_env_vars_recursive(*t);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) expand_env_vars_in_node(elem);
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file overlays it
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

// Negative counts become 0 so validation reports them
size_t toml_count(const toml::table& tbl, const std::string_view key, size_t default_val) {
    const int64_t v = tbl[key].value_or(static_cast<int64_t>(default_val));
    return v < 0 ? 0 : static_cast<size_t>(v);
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

SourceConfig ConfigLoader::extract_source(const toml::table& root) {
    SourceConfig cfg;
    const auto* source = root["source"].as_table();
    if (!source) return cfg;
    const auto& s = *source;

    cfg.connection_string = s["connection_string"].value_or(""s);
    cfg.schema = s["schema"].value_or("public"s);
    cfg.min_connections = toml_count(s, "min_connections", cfg.min_connections);
    cfg.max_connections = toml_count(s, "max_connections", cfg.max_connections);
    cfg.connection_timeout_ms = s["connection_timeout_ms"].value_or(cfg.connection_timeout_ms);
    cfg.query_timeout_ms = s["query_timeout_ms"].value_or(cfg.query_timeout_ms);
    cfg.idle_timeout_seconds = s["idle_timeout_seconds"].value_or(cfg.idle_timeout_seconds);
    cfg.max_lifetime_seconds = s["max_lifetime_seconds"].value_or(cfg.max_lifetime_seconds);
    cfg.health_check_query = s["health_check_query"].value_or(cfg.health_check_query);
    return cfg;
}

RetryConfig ConfigLoader::extract_retry(const toml::table& root) {
    RetryConfig cfg;
    const auto* rt = root["retry"].as_table();
    if (!rt) return cfg;

    cfg.max_attempts = (*rt)["max_attempts"].value_or(cfg.max_attempts);
    cfg.initial_backoff_ms = (*rt)["initial_backoff_ms"].value_or(cfg.initial_backoff_ms);
    cfg.backoff_multiplier = (*rt)["backoff_multiplier"].value_or(cfg.backoff_multiplier);
    cfg.max_backoff_ms = (*rt)["max_backoff_ms"].value_or(cfg.max_backoff_ms);
    return cfg;
}

SyncConfig ConfigLoader::extract_sync(const toml::table& root) {
    SyncConfig cfg;
    const auto* sync = root["sync"].as_table();
    if (!sync) return cfg;
    const auto& s = *sync;

    cfg.batch_size = toml_count(s, "batch_size", cfg.batch_size);
    cfg.table_workers = toml_count(s, "table_workers", cfg.table_workers);
    cfg.include = toml_string_array(s, "include");
    cfg.exclude = toml_string_array(s, "exclude");
    if (s["default_exclude"].is_array()) {
        cfg.default_exclude = toml_string_array(s, "default_exclude");
    }
    cfg.partition_column = s["partition_column"].value_or(cfg.partition_column);
    cfg.reconcile_deletes = s["reconcile_deletes"].value_or(false);
    cfg.delete_sample_size = toml_count(s, "delete_sample_size", cfg.delete_sample_size);
    cfg.schema_cache_path = s["schema_cache_path"].value_or(""s);
    cfg.file_sample_size = toml_count(s, "file_sample_size", cfg.file_sample_size);
    cfg.index_schema_metadata = s["index_schema_metadata"].value_or(false);
    return cfg;
}

CheckpointConfig ConfigLoader::extract_checkpoint(const toml::table& root) {
    CheckpointConfig cfg;
    if (const auto* cp = root["checkpoint"].as_table()) {
        cfg.path = (*cp)["path"].value_or(cfg.path);
    }
    return cfg;
}

IndexConfig ConfigLoader::extract_index(const toml::table& root) {
    IndexConfig cfg;
    const auto* index = root["index"].as_table();
    if (!index) return cfg;
    const auto& i = *index;

    cfg.endpoint = i["endpoint"].value_or(cfg.endpoint);
    cfg.document_namespace = i["namespace"].value_or(cfg.document_namespace);
    cfg.document_type = i["document_type"].value_or(cfg.document_type);
    cfg.metadata_document_type = i["metadata_document_type"].value_or(cfg.metadata_document_type);
    cfg.timeout_ms = i["timeout_ms"].value_or(cfg.timeout_ms);
    cfg.auth_header = i["auth_header"].value_or(""s);
    return cfg;
}

DownloadsConfig ConfigLoader::extract_downloads(const toml::table& root) {
    DownloadsConfig cfg;
    const auto* downloads = root["downloads"].as_table();
    if (!downloads) return cfg;
    const auto& d = *downloads;

    cfg.enabled = d["enabled"].value_or(true);
    cfg.directory = d["directory"].value_or(cfg.directory);
    cfg.workers = toml_count(d, "workers", cfg.workers);
    cfg.max_file_size_bytes = toml_count(d, "max_file_size_bytes", cfg.max_file_size_bytes);
    if (d["supported_types"].is_array()) {
        cfg.supported_types.clear();
        for (const auto& t : toml_string_array(d, "supported_types")) {
            auto ext = utils::to_lower(t);
            if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
            cfg.supported_types.push_back(std::move(ext));
        }
    }
    cfg.max_attempts = d["max_attempts"].value_or(cfg.max_attempts);
    cfg.initial_backoff_ms = d["initial_backoff_ms"].value_or(cfg.initial_backoff_ms);
    cfg.timeout_ms = d["timeout_ms"].value_or(cfg.timeout_ms);
    cfg.strategy = d["strategy"].value_or(cfg.strategy);
    return cfg;
}

StorageConfig ConfigLoader::extract_storage(const toml::table& root) {
    StorageConfig cfg;
    const auto* storage = root["storage"].as_table();
    if (!storage) return cfg;
    const auto& s = *storage;

    cfg.bucket = s["bucket"].value_or(""s);
    cfg.region = s["region"].value_or(cfg.region);
    cfg.endpoint = s["endpoint"].value_or(""s);
    cfg.access_key_id = s["access_key_id"].value_or(""s);
    cfg.secret_access_key = s["secret_access_key"].value_or(""s);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    cfg.file = (*logging)["file"].value_or(""s);
    return cfg;
}

void ConfigLoader::extract_tables(const toml::table& root, SyncEngineConfig& config) {
    if (const auto* fields = root["content_fields"].as_table()) {
        for (const auto& [table, val] : *fields) {
            if (!val.is_array()) continue;
            config.content_fields[std::string(table.str())] = toml_string_array(*fields, table.str());
        }
    }
    if (const auto* descriptions = root["table_descriptions"].as_table()) {
        for (const auto& [table, val] : *descriptions) {
            if (const auto* s = val.as_string()) {
                config.table_descriptions[std::string(table.str())] = s->get();
            }
        }
    }
}

// ---- Shared extraction + validation ----------------------------------------

SyncEngineConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    SyncEngineConfig config;
    config.source = extract_source(root);
    config.retry = extract_retry(root);
    config.sync = extract_sync(root);
    config.checkpoint = extract_checkpoint(root);
    config.index = extract_index(root);
    config.downloads = extract_downloads(root);
    config.storage = extract_storage(root);
    config.logging = extract_logging(root);
    extract_tables(root, config);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(SyncEngineConfig config, bool dry_run) {
    const auto errors = validate_config(config, dry_run);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path, bool dry_run) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl), dry_run);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content, bool dry_run) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl), dry_run);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const SyncEngineConfig& config, bool dry_run) {
    std::vector<std::string> errors;

    if (config.source.connection_string.empty()) {
        errors.emplace_back("source.connection_string must not be empty");
    }
    if (config.source.max_connections == 0) {
        errors.emplace_back("source.max_connections must be >= 1");
    }
    if (config.source.min_connections > config.source.max_connections) {
        errors.push_back(std::format("source.min_connections ({}) > max_connections ({})",
            config.source.min_connections, config.source.max_connections));
    }

    if (config.retry.max_attempts < 1) {
        errors.push_back(std::format("retry.max_attempts must be >= 1, got {}", config.retry.max_attempts));
    }
    if (config.retry.backoff_multiplier < 1.0) {
        errors.push_back(std::format("retry.backoff_multiplier must be >= 1.0, got {}",
            config.retry.backoff_multiplier));
    }

    if (config.sync.batch_size < 1) {
        errors.emplace_back("sync.batch_size must be >= 1");
    }
    if (config.sync.table_workers < 1) {
        errors.emplace_back("sync.table_workers must be >= 1");
    }

    if (!dry_run) {
        if (config.index.endpoint.empty()) {
            errors.emplace_back("index.endpoint must not be empty");
        } else if (!utils::parse_http_url(config.index.endpoint)) {
            errors.push_back(std::format("index.endpoint is not an http(s) URL: {}", config.index.endpoint));
        }
    }

    if (config.downloads.enabled) {
        if (config.downloads.workers < 1) {
            errors.emplace_back("downloads.workers must be >= 1 when downloads are enabled");
        }
        if (config.downloads.directory.empty()) {
            errors.emplace_back("downloads.directory must not be empty when downloads are enabled");
        }
        const auto strategy = download_strategy_from_string(config.downloads.strategy);
        if (!strategy) {
            errors.push_back(std::format("downloads.strategy must be presigned_url or direct_storage, got '{}'",
                config.downloads.strategy));
        } else if (*strategy == DownloadStrategy::DIRECT_STORAGE) {
            if (config.storage.bucket.empty()) {
                errors.emplace_back("storage.bucket required when downloads.strategy = direct_storage");
            }
            if (config.storage.access_key_id.empty() || config.storage.secret_access_key.empty()) {
                errors.emplace_back("storage credentials required when downloads.strategy = direct_storage");
            }
        }
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
            config.logging.level));
    }

    return errors;
}

} // namespace dbsync
