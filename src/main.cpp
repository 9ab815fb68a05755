#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "db/connection_manager.hpp"
#include "db/source_connection_pool.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_source_reader.hpp"
#include "files/file_downloader.hpp"
#include "files/object_stores.hpp"
#include "index/discard_index_sink.hpp"
#include "index/vespa_index_sink.hpp"
#include "schema/schema_export.hpp"
#include "sync/sqlite_checkpoint_store.hpp"
#include "sync/sync_orchestrator.hpp"
#include "sync/sync_report.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace dbsync;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void signal_handler(int) {
    g_interrupted = 1;
}

void print_usage() {
    std::cerr <<
        "usage: dbsync [config.toml] <command> [options]\n"
        "\n"
        "commands:\n"
        "  discover [--json|--markdown] [--output FILE] [--index-metadata]\n"
        "  sync full|incremental [--tables a,b] [--exclude glob,...] [--dry-run]\n"
        "  sync-table TABLE [--full] [--dry-run]\n"
        "  status\n"
        "  reset [TABLE]\n";
}

struct CliArgs {
    std::string config_file = "config/dbsync.toml";
    std::string command;
    std::vector<std::string> positional;
    std::vector<std::string> tables;
    std::vector<std::string> exclude;
    std::string output;
    bool json = true;
    bool dry_run = false;
    bool full = false;
    bool index_metadata = false;
};

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    for (auto& part : utils::split(value, ',')) {
        auto t = utils::trim(part);
        if (!t.empty()) out.push_back(std::move(t));
    }
    return out;
}

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    CliArgs args;
    int i = 1;
    if (i < argc && std::string_view(argv[i]).ends_with(".toml")) {
        args.config_file = argv[i++];
    }
    if (i >= argc) return std::nullopt;
    args.command = argv[i++];

    for (; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--json") {
            args.json = true;
        } else if (arg == "--markdown") {
            args.json = false;
        } else if (arg == "--output" && has_value) {
            args.output = argv[++i];
        } else if (arg == "--tables" && has_value) {
            args.tables = split_list(argv[++i]);
        } else if (arg == "--exclude" && has_value) {
            args.exclude = split_list(argv[++i]);
        } else if (arg == "--dry-run") {
            args.dry_run = true;
        } else if (arg == "--full") {
            args.full = true;
        } else if (arg == "--index-metadata") {
            args.index_metadata = true;
        } else if (arg.starts_with("--")) {
            std::cerr << std::format("unknown option: {}\n", arg);
            return std::nullopt;
        } else {
            args.positional.push_back(arg);
        }
    }
    return args;
}

void write_output(const std::string& path, const std::string& content) {
    if (path.empty()) {
        std::cout << content << '\n';
        return;
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw SyncError(ErrorCategory::CONFIG_ERROR, std::format("cannot write {}", path));
    }
    out << content << '\n';
    utils::log::info(std::format("Wrote {}", path));
}

// =========================================================================
// Engine wiring
// =========================================================================

RetryPolicy make_retry(const RetryConfig& cfg) {
    RetryPolicy retry;
    retry.max_attempts = cfg.max_attempts;
    retry.initial_backoff = std::chrono::milliseconds{cfg.initial_backoff_ms};
    retry.multiplier = cfg.backoff_multiplier;
    retry.max_backoff = std::chrono::milliseconds{cfg.max_backoff_ms};
    return retry;
}

std::shared_ptr<ConnectionManager> make_connections(const SyncEngineConfig& cfg) {
    PoolConfig pool_config;
    pool_config.connection_string = cfg.source.connection_string;
    pool_config.min_connections = cfg.source.min_connections;
    pool_config.max_connections = cfg.source.max_connections;
    pool_config.idle_timeout = std::chrono::milliseconds{cfg.source.idle_timeout_seconds * 1000LL};
    pool_config.max_lifetime = std::chrono::seconds{cfg.source.max_lifetime_seconds};
    pool_config.health_check_query = cfg.source.health_check_query;

    auto factory = std::make_shared<PgConnectionFactory>(static_cast<uint32_t>(cfg.source.query_timeout_ms));
    auto pool = std::make_shared<SourceConnectionPool>("source", pool_config, factory);
    return std::make_shared<ConnectionManager>(pool, make_retry(cfg.retry),
        std::chrono::milliseconds{cfg.source.connection_timeout_ms});
}

std::shared_ptr<const FileDownloader> make_downloader(const SyncEngineConfig& cfg) {
    if (!cfg.downloads.enabled) {
        utils::log::info("File downloads disabled");
        return nullptr;
    }

    DownloadPolicy policy;
    policy.supported_types = {cfg.downloads.supported_types.begin(), cfg.downloads.supported_types.end()};
    policy.max_file_size = cfg.downloads.max_file_size_bytes;

    RetryPolicy retry = make_retry(cfg.retry);
    retry.max_attempts = cfg.downloads.max_attempts;
    retry.initial_backoff = std::chrono::milliseconds{cfg.downloads.initial_backoff_ms};

    const auto timeout = std::chrono::milliseconds{cfg.downloads.timeout_ms};
    auto url_store = std::make_shared<HttpObjectStore>(timeout);

    std::shared_ptr<IObjectStore> storage_store;
    if (!cfg.storage.bucket.empty()) {
        StorageCredentials creds;
        creds.bucket = cfg.storage.bucket;
        creds.region = cfg.storage.region;
        creds.endpoint = cfg.storage.endpoint;
        creds.access_key_id = cfg.storage.access_key_id;
        creds.secret_access_key = cfg.storage.secret_access_key;
        storage_store = std::make_shared<S3ObjectStore>(std::move(creds), timeout);
    }

    const auto strategy = download_strategy_from_string(cfg.downloads.strategy)
        .value_or(DownloadStrategy::PRESIGNED_URL);
    utils::log::info(std::format("File downloads: {} workers into {} ({})",
        cfg.downloads.workers, cfg.downloads.directory, cfg.downloads.strategy));
    return std::make_shared<FileDownloader>(cfg.downloads.directory, std::move(policy), std::move(retry),
        strategy, std::move(url_store), std::move(storage_store));
}

SyncOptions make_options(const SyncEngineConfig& cfg) {
    SyncOptions options;
    options.batch_size = cfg.sync.batch_size;
    options.table_workers = cfg.sync.table_workers;
    options.download_workers = cfg.downloads.workers;
    options.default_exclude = cfg.sync.default_exclude;
    options.reconcile_deletes = cfg.sync.reconcile_deletes;
    options.delete_sample_size = cfg.sync.delete_sample_size;
    options.schema_cache_path = cfg.sync.schema_cache_path;
    options.index_schema_metadata = cfg.sync.index_schema_metadata;
    options.discovery.file_sample_size = cfg.sync.file_sample_size;
    options.transform.partition_column = cfg.sync.partition_column;
    options.transform.content_fields = cfg.content_fields;
    options.transform.table_descriptions = cfg.table_descriptions;
    return options;
}

VespaIndexSink::Config make_index_config(const SyncEngineConfig& cfg) {
    VespaIndexSink::Config index;
    index.endpoint = cfg.index.endpoint;
    index.document_namespace = cfg.index.document_namespace;
    index.document_type = cfg.index.document_type;
    index.metadata_document_type = cfg.index.metadata_document_type;
    index.timeout = std::chrono::milliseconds{cfg.index.timeout_ms};
    index.auth_header = cfg.index.auth_header;
    return index;
}

int exit_code_for(const SyncResult& result) {
    if (result.state == JobState::FAILED) return 2;
    if (result.state == JobState::CANCELLED) return 130;
    return result.total_failed() > 0 ? 1 : 0;
}

} // namespace

int main(int argc, char* argv[]) {
    const auto parsed = parse_args(argc, argv);
    if (!parsed) {
        print_usage();
        return 64;
    }
    const auto& args = *parsed;

    try {
        utils::log::info(std::format("[1/4] Loading configuration from {}", args.config_file));
        auto config_result = ConfigLoader::load_from_file(args.config_file, args.dry_run);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 78;
        }
        const auto& cfg = config_result.config;

        if (const auto level = utils::log::parse_level(cfg.logging.level)) {
            utils::log::set_level(*level);
        }
        if (!cfg.logging.file.empty() && !utils::log::set_file(cfg.logging.file)) {
            utils::log::warn(std::format("Cannot open log file {}", cfg.logging.file));
        }

        utils::log::info(std::format("[2/4] Checkpoint store: {}", cfg.checkpoint.path));
        SqliteCheckpointStore checkpoints(cfg.checkpoint.path);

        // Only commands that write documents need a reachable index
        const bool syncing = args.command == "sync" || args.command == "sync-table";
        const bool writes_index = (syncing && !args.dry_run) ||
            (args.command == "discover" && (cfg.sync.index_schema_metadata || args.index_metadata));
        std::unique_ptr<IIndexSink> index;
        if (writes_index) {
            utils::log::info(std::format("[3/4] Index: {} ({}/{})",
                cfg.index.endpoint, cfg.index.document_namespace, cfg.index.document_type));
            index = std::make_unique<VespaIndexSink>(make_index_config(cfg));
        } else {
            utils::log::info(std::format("[3/4] Index: not written by '{}'{}",
                args.command, args.dry_run ? " (dry run)" : ""));
            index = std::make_unique<DiscardIndexSink>();
        }

        utils::log::info(std::format("[4/4] Source: schema '{}', pool {}..{}",
            cfg.source.schema, cfg.source.min_connections, cfg.source.max_connections));
        auto connections = make_connections(cfg);
        PgSourceReader source(connections, cfg.source.schema);

        SyncOrchestrator orchestrator(
            SyncContext{source, checkpoints, *index, syncing ? make_downloader(cfg) : nullptr},
            make_options(cfg));

        // Ctrl-C cancels the running job; the orchestrator checkpoints and returns
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        std::jthread interrupt_watch([&orchestrator](std::stop_token st) {
            while (!st.stop_requested()) {
                if (g_interrupted) {
                    utils::log::warn("Interrupted, cancelling the running job");
                    orchestrator.cancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds{100});
            }
        });

        int rc = 0;
        if (args.command == "discover") {
            auto result = orchestrator.run_schema_discovery();
            if (result.state == JobState::COMPLETED) {
                const auto schema = orchestrator.schema();
                write_output(args.output, args.json
                    ? schema_to_json(*schema).dump(2)
                    : schema_to_markdown(*schema));
                if (args.index_metadata && !cfg.sync.index_schema_metadata) {
                    orchestrator.index_schema_metadata();
                }
            } else {
                std::cout << sync_result_to_json(result).dump(2) << '\n';
            }
            rc = exit_code_for(result);

        } else if (args.command == "sync") {
            if (args.positional.size() != 1) {
                print_usage();
                return 64;
            }
            const auto mode = sync_mode_from_string(args.positional[0]);
            if (!mode || *mode == SyncMode::SCHEMA_DISCOVERY) {
                print_usage();
                return 64;
            }
            RunRequest request;
            request.filter.include = args.tables.empty() ? cfg.sync.include : args.tables;
            request.filter.exclude = cfg.sync.exclude;
            request.filter.exclude.insert(request.filter.exclude.end(), args.exclude.begin(), args.exclude.end());
            request.dry_run = args.dry_run;

            const auto result = *mode == SyncMode::FULL
                ? orchestrator.run_full(request)
                : orchestrator.run_incremental(request);
            std::cout << sync_result_to_json(result).dump(2) << '\n';
            rc = exit_code_for(result);

        } else if (args.command == "sync-table") {
            if (args.positional.size() != 1) {
                print_usage();
                return 64;
            }
            const auto result = orchestrator.sync_table(args.positional[0], args.full, args.dry_run);
            std::cout << sync_result_to_json(result).dump(2) << '\n';
            rc = exit_code_for(result);

        } else if (args.command == "status") {
            std::cout << sync_status_to_json(orchestrator.status()).dump(2) << '\n';

        } else if (args.command == "reset") {
            std::optional<std::string> table;
            if (!args.positional.empty()) table = args.positional[0];
            orchestrator.reset(table);
            utils::log::info(table ? std::format("Checkpoint for '{}' cleared", *table)
                                   : std::string("All checkpoints cleared"));

        } else {
            print_usage();
            return 64;
        }

        interrupt_watch.request_stop();
        const auto pool = connections->pool_stats();
        utils::log::debug(std::format("Source pool: {} leases, {} timeouts, {} failed health checks",
            pool.leases, pool.timeouts, pool.health_check_failures));
        connections->shutdown();
        return rc;

    } catch (const SyncError& e) {
        utils::log::error(std::format("Fatal ({}): {}", error_category_to_string(e.category()), e.what()));
        return 2;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return 1;
    }
}
