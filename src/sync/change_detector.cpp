#include "sync/change_detector.hpp"
#include "core/timestamp.hpp"
#include "core/utils.hpp"

#include <format>
#include <unordered_set>

namespace dbsync {

ChangeDetector::ChangeDetector(ISourceReader& reader, size_t batch_size)
    : reader_(reader), batch_size_(batch_size == 0 ? 1 : batch_size) {}

ChangePlan ChangeDetector::plan(const Table& table, SyncMode mode,
                                const std::optional<Checkpoint>& checkpoint) const {
    ChangePlan plan;
    plan.mode = mode;
    plan.request.table = table.name;
    plan.request.columns = table.columns;
    plan.request.id_column = table.primary_key;
    plan.request.batch_size = batch_size_;

    if (checkpoint) {
        plan.base_watermark = checkpoint->watermark;
        // A run cut short by cancellation or connection loss leaves its position behind
        const bool interrupted = checkpoint->status == CheckpointStatus::RUNNING ||
                                 checkpoint->status == CheckpointStatus::FAILED;
        const bool positioned = interrupted && checkpoint->last_row_id.has_value();

        // Rows past an unfinished full scan were never seen; finish it before going incremental
        if (positioned && mode == SyncMode::INCREMENTAL && checkpoint->mode == SyncMode::FULL) {
            plan.mode = SyncMode::FULL;
            utils::log::info(std::format("Table '{}' has an unfinished full scan, completing it first",
                table.name));
        }
        plan.resuming = positioned && checkpoint->mode == plan.mode;
    }

    const auto wm = table.watermark_column();
    if (plan.mode == SyncMode::INCREMENTAL && wm) {
        plan.request.watermark_column = *wm;
        plan.request.watermark_after = plan.base_watermark;
    } else if (plan.mode == SyncMode::INCREMENTAL) {
        plan.full_rescan_fallback = true;
        utils::log::warn(std::format("Table '{}' has no watermark column, incremental sync falls back to a full scan",
            table.name));
    }

    if (plan.resuming) {
        plan.request.resume_after_id = checkpoint->last_row_id;
        utils::log::info(std::format("Resuming {} sync of '{}' after row {}",
            sync_mode_to_string(plan.mode), table.name, *checkpoint->last_row_id));
    }
    return plan;
}

std::unique_ptr<IRowStream> ChangeDetector::open(const ChangePlan& plan, std::stop_token st) const {
    return reader_.scan(plan.request, st);
}

std::vector<std::string> ChangeDetector::detect_deletes(const Table& table,
                                                        IIndexSink& index,
                                                        size_t sample_size) const {
    const auto known = index.sample_source_ids(table.name, sample_size);
    if (known.empty()) return {};

    const auto existing = reader_.existing_ids(table.name, table.primary_key, known);
    const std::unordered_set<std::string> present(existing.begin(), existing.end());

    std::vector<std::string> deleted;
    for (const auto& id : known) {
        if (!present.contains(id)) deleted.push_back(id);
    }
    utils::log::debug(std::format("Delete reconciliation for '{}': {} sampled, {} missing from source",
        table.name, known.size(), deleted.size()));
    return deleted;
}

std::optional<std::string> ChangeDetector::advance_watermark(const std::optional<std::string>& current,
                                                             const std::optional<std::string>& observed) {
    if (!observed) return current;
    const auto obs = timestamp::parse_micros(*observed);
    if (!obs) return current;
    if (!current) return timestamp::format_micros(*obs);

    const auto cur = timestamp::parse_micros(*current);
    if (!cur || *obs > *cur) return timestamp::format_micros(*obs);
    return current;
}

} // namespace dbsync
