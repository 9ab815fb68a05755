#include "sync/sync_report.hpp"
#include "core/utils.hpp"

namespace dbsync {

namespace {

using json = nlohmann::json;

json optional_string(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

json error_entry_json(const SyncErrorEntry& e) {
    return {
        {"table", e.table},
        {"row_id", optional_string(e.row_id)},
        {"category", error_category_to_string(e.category)},
        {"severity", e.severity == ErrorSeverity::WARNING ? "warning" : "error"},
        {"message", e.message},
        {"timestamp", utils::format_utc(e.timestamp)}
    };
}

json table_progress_json(const TableProgress& p) {
    return {
        {"table", p.table},
        {"status", checkpoint_status_to_string(p.status)},
        {"rows_processed", p.rows_processed},
        {"rows_failed", p.rows_failed},
        {"rows_deleted", p.rows_deleted},
        {"relationships_skipped", p.relationships_skipped},
        {"files_detected", p.files_detected},
        {"files_downloaded", p.files_downloaded},
        {"files_skipped", p.files_skipped},
        {"files_failed", p.files_failed},
        {"full_rescan_fallback", p.full_rescan_fallback},
        {"watermark", optional_string(p.watermark)},
        {"error", optional_string(p.error)}
    };
}

} // namespace

json sync_result_to_json(const SyncResult& result) {
    json tables = json::array();
    for (const auto& t : result.tables) tables.push_back(table_progress_json(t));

    json errors = json::array();
    for (const auto& e : result.errors) errors.push_back(error_entry_json(e));

    return {
        {"job_id", result.job_id},
        {"mode", sync_mode_to_string(result.mode)},
        {"state", job_state_to_string(result.state)},
        {"dry_run", result.dry_run},
        {"started_at", utils::format_utc(result.started_at)},
        {"finished_at", result.finished_at ? json(utils::format_utc(*result.finished_at)) : json(nullptr)},
        {"total_processed", result.total_processed()},
        {"total_failed", result.total_failed()},
        {"tables", std::move(tables)},
        {"errors", std::move(errors)}
    };
}

json checkpoint_to_json(const Checkpoint& checkpoint) {
    return {
        {"table", checkpoint.table},
        {"status", checkpoint_status_to_string(checkpoint.status)},
        {"mode", sync_mode_to_string(checkpoint.mode)},
        {"watermark", optional_string(checkpoint.watermark)},
        {"last_row_id", optional_string(checkpoint.last_row_id)},
        {"rows_processed", checkpoint.rows_processed},
        {"rows_failed", checkpoint.rows_failed},
        {"last_error", optional_string(checkpoint.last_error)},
        {"updated_at", utils::format_utc(checkpoint.updated_at)}
    };
}

json sync_status_to_json(const SyncStatus& status) {
    json checkpoints = json::array();
    for (const auto& cp : status.checkpoints) checkpoints.push_back(checkpoint_to_json(cp));

    return {
        {"tables_monitored", status.tables_monitored},
        {"total_records", status.total_records},
        {"total_failed", status.total_failed},
        {"current_job_id", optional_string(status.current_job_id)},
        {"current_job_state", status.current_job_state
            ? json(job_state_to_string(*status.current_job_state)) : json(nullptr)},
        {"tables", std::move(checkpoints)}
    };
}

} // namespace dbsync
