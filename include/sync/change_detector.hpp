#pragma once

#include "core/types.hpp"
#include "db/isource_reader.hpp"
#include "index/iindex_sink.hpp"

#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace dbsync {

/**
 * @brief How one table will be streamed in one run
 */
struct ChangePlan {
    ScanRequest request;
    SyncMode mode = SyncMode::FULL;             // Mode the table is scanned in
    bool full_rescan_fallback = false;          // Incremental asked, table has no watermark column
    bool resuming = false;                      // Continuing an interrupted run of the same mode
    std::optional<std::string> base_watermark;  // Checkpoint watermark the plan starts from
};

/**
 * @brief Computes the rows inserted or updated since the last checkpoint
 *
 * Incremental: rows whose watermark is strictly greater than the checkpoint
 * watermark, ordered by (watermark, id). A table without a watermark column
 * degrades to a full scan and the plan says so.
 *
 * A checkpoint left RUNNING or FAILED with a row position by a run of the
 * same mode resumes after its last row id (full scans) or after
 * (watermark, id) (incremental). An incremental run that finds an unfinished
 * full scan completes that scan instead, since its checkpoint watermark only
 * covers the rows before the scan started.
 *
 * Deletes are only inferred on request, by probing a sample of indexed ids.
 */
class ChangeDetector {
public:
    ChangeDetector(ISourceReader& reader, size_t batch_size);

    [[nodiscard]] ChangePlan plan(const Table& table, SyncMode mode,
                                  const std::optional<Checkpoint>& checkpoint) const;

    [[nodiscard]] std::unique_ptr<IRowStream> open(const ChangePlan& plan, std::stop_token st = {}) const;

    /**
     * @brief Ids indexed for the table that no longer exist in the source
     * @throws IndexError when sampling fails, ConnectionError/QueryError when probing fails
     */
    [[nodiscard]] std::vector<std::string> detect_deletes(const Table& table,
                                                          IIndexSink& index,
                                                          size_t sample_size) const;

    /**
     * @brief The later of two canonical watermarks (compared as instants)
     *
     * Never moves backwards: an unparseable or earlier observation keeps current.
     */
    [[nodiscard]] static std::optional<std::string> advance_watermark(
        const std::optional<std::string>& current, const std::optional<std::string>& observed);

private:
    ISourceReader& reader_;
    size_t batch_size_;
};

} // namespace dbsync
