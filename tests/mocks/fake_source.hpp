#pragma once

#include "db/isource_reader.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "core/error.hpp"
#include "core/timestamp.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <set>

namespace dbsync::testing {

[[nodiscard]] inline Column make_column(const std::string& name, const std::string& data_type,
                                        const std::string& udt_name = "") {
    return Column(name, data_type, PgTypeMap::build_type_info(data_type, udt_name));
}

/**
 * @brief In-memory ISourceReader
 *
 * Tables hold rows as column -> text maps. scan() honours the same
 * watermark/resume contract as the PostgreSQL reader, comparing ids
 * numerically when both sides are integers.
 */
class FakeSourceReader : public ISourceReader {
public:
    using Values = std::map<std::string, std::optional<std::string>>;

    // Called after a batch is produced, before it is returned
    using BatchHook = std::function<void(const std::string& table, size_t batch_index)>;

    explicit FakeSourceReader(std::string database = "appdb") : database_(std::move(database)) {}

    void add_table(const std::string& name, std::vector<Column> columns,
                   std::optional<std::string> primary_key = std::string("id")) {
        std::lock_guard lock(mutex_);
        auto& t = tables_[name];
        t.columns = std::move(columns);
        t.primary_key = std::move(primary_key);
    }

    void upsert_row(const std::string& table, Values values) {
        std::lock_guard lock(mutex_);
        auto& t = tables_.at(table);
        const auto pk = t.primary_key.value_or("id");
        const auto id = values.count(pk) ? values.at(pk) : std::nullopt;
        for (auto& row : t.rows) {
            if (id && row.count(pk) && row.at(pk) == id) {
                for (auto& [k, v] : values) row[k] = v;
                return;
            }
        }
        t.rows.push_back(std::move(values));
    }

    void delete_row(const std::string& table, const std::string& id) {
        std::lock_guard lock(mutex_);
        auto& t = tables_.at(table);
        const auto pk = t.primary_key.value_or("id");
        std::erase_if(t.rows, [&](const Values& row) {
            return row.count(pk) && row.at(pk) == id;
        });
    }

    void set_samples(const std::string& table, const std::string& column, std::vector<std::string> samples) {
        std::lock_guard lock(mutex_);
        samples_[table + "." + column] = std::move(samples);
    }

    void fail_columns_for(const std::string& table) {
        std::lock_guard lock(mutex_);
        broken_tables_.insert(table);
    }

    // Every scan of the table fails with a ConnectionError
    void fail_scans_for(const std::string& table) {
        std::lock_guard lock(mutex_);
        failing_scans_.insert(table);
    }

    void set_unreachable(bool v) { unreachable_ = v; }

    void on_batch(BatchHook hook) {
        std::lock_guard lock(mutex_);
        hook_ = std::move(hook);
    }

    [[nodiscard]] size_t scan_count() const { return scans_.load(); }

    [[nodiscard]] size_t existing_ids_calls() const { return existing_calls_.load(); }

    // ========================================================================
    // ISourceReader
    // ========================================================================

    std::string database_name() override {
        check_reachable();
        return database_;
    }

    std::vector<std::string> list_tables() override {
        check_reachable();
        std::lock_guard lock(mutex_);
        std::vector<std::string> names;
        for (const auto& [name, t] : tables_) names.push_back(name);
        return names;
    }

    std::vector<Column> list_columns(const std::string& table) override {
        check_reachable();
        std::lock_guard lock(mutex_);
        if (broken_tables_.contains(table)) {
            throw SchemaError("permission denied for table " + table);
        }
        return tables_.at(table).columns;
    }

    std::optional<std::string> primary_key(const std::string& table) override {
        std::lock_guard lock(mutex_);
        return tables_.at(table).primary_key;
    }

    int64_t estimate_row_count(const std::string& table) override {
        std::lock_guard lock(mutex_);
        return static_cast<int64_t>(tables_.at(table).rows.size());
    }

    std::vector<std::string> sample_values(const std::string& table, const std::string& column,
                                           size_t limit) override {
        std::lock_guard lock(mutex_);
        if (const auto it = samples_.find(table + "." + column); it != samples_.end()) {
            auto out = it->second;
            if (out.size() > limit) out.resize(limit);
            return out;
        }
        std::vector<std::string> out;
        for (const auto& row : tables_.at(table).rows) {
            if (out.size() >= limit) break;
            if (const auto it = row.find(column); it != row.end() && it->second) {
                out.push_back(*it->second);
            }
        }
        return out;
    }

    std::unique_ptr<IRowStream> scan(const ScanRequest& request, std::stop_token st) override {
        check_reachable();
        scans_.fetch_add(1);

        std::lock_guard lock(mutex_);
        const auto& t = tables_.at(request.table);
        const bool fail = failing_scans_.contains(request.table);

        std::vector<SourceRow> rows;
        for (const auto& values : t.rows) {
            if (!matches(request, values)) continue;
            rows.push_back(to_row(t.columns, values));
        }
        std::sort(rows.begin(), rows.end(), [&request](const SourceRow& a, const SourceRow& b) {
            if (request.watermark_column) {
                const auto wa = *timestamp::parse_micros(*a.value(*request.watermark_column));
                const auto wb = *timestamp::parse_micros(*b.value(*request.watermark_column));
                if (wa != wb) return wa < wb;
            }
            return id_less(a.value(request.id_column).value_or(""), b.value(request.id_column).value_or(""));
        });

        return std::make_unique<Stream>(request.table, std::move(rows), request.batch_size,
                                        std::move(st), hook_, fail);
    }

    std::vector<std::string> existing_ids(const std::string& table, const std::string& id_column,
                                          const std::vector<std::string>& ids) override {
        check_reachable();
        existing_calls_.fetch_add(1);
        std::lock_guard lock(mutex_);
        std::set<std::string> present;
        for (const auto& row : tables_.at(table).rows) {
            if (const auto it = row.find(id_column); it != row.end() && it->second) {
                present.insert(*it->second);
            }
        }
        std::vector<std::string> found;
        for (const auto& id : ids) {
            if (present.contains(id)) found.push_back(id);
        }
        return found;
    }

    // Numeric when both ids are integers, else lexicographic
    static bool id_less(const std::string& a, const std::string& b) {
        const auto na = utils::try_parse_int<int64_t>(a);
        const auto nb = utils::try_parse_int<int64_t>(b);
        if (na && nb) return *na < *nb;
        return a < b;
    }

private:
    struct FakeTable {
        std::vector<Column> columns;
        std::optional<std::string> primary_key;
        std::vector<Values> rows;
    };

    class Stream : public IRowStream {
    public:
        Stream(std::string table, std::vector<SourceRow> rows, size_t batch_size,
               std::stop_token st, BatchHook hook, bool fail)
            : table_(std::move(table)), rows_(std::move(rows)),
              batch_size_(batch_size == 0 ? 1 : batch_size),
              stop_(std::move(st)), hook_(std::move(hook)), fail_(fail) {}

        std::optional<std::vector<SourceRow>> next_batch() override {
            if (fail_) throw ConnectionError("server closed the connection unexpectedly");
            if (stop_.stop_requested()) throw CancelledError("fetch cancelled");
            if (pos_ >= rows_.size()) return std::nullopt;

            const size_t end = std::min(rows_.size(), pos_ + batch_size_);
            std::vector<SourceRow> batch(rows_.begin() + static_cast<std::ptrdiff_t>(pos_),
                                         rows_.begin() + static_cast<std::ptrdiff_t>(end));
            pos_ = end;
            if (hook_) hook_(table_, batches_);
            ++batches_;
            return batch;
        }

    private:
        std::string table_;
        std::vector<SourceRow> rows_;
        size_t batch_size_;
        size_t pos_ = 0;
        size_t batches_ = 0;
        std::stop_token stop_;
        BatchHook hook_;
        bool fail_;
    };

    void check_reachable() const {
        if (unreachable_.load()) throw ConnectionError("could not connect to server: Connection refused");
    }

    static bool matches(const ScanRequest& request, const Values& values) {
        const auto get = [&values](const std::string& col) -> std::optional<std::string> {
            const auto it = values.find(col);
            return it == values.end() ? std::nullopt : it->second;
        };
        const auto id = get(request.id_column).value_or("");

        if (!request.watermark_column) {
            return !request.resume_after_id || id_less(*request.resume_after_id, id);
        }

        const auto raw = get(*request.watermark_column);
        if (!raw) return false;
        const auto wm = timestamp::parse_micros(*raw);
        if (!wm) return false;
        if (!request.watermark_after) return true;

        const auto after = *timestamp::parse_micros(*request.watermark_after);
        if (*wm > after) return true;
        return *wm == after && request.resume_after_id && id_less(*request.resume_after_id, id);
    }

    static SourceRow to_row(const std::vector<Column>& columns, const Values& values) {
        SourceRow row;
        for (const auto& c : columns) {
            const auto it = values.find(c.name);
            row.fields.emplace_back(c.name, c.type_info, it == values.end() ? std::nullopt : it->second);
        }
        return row;
    }

    std::string database_;
    std::mutex mutex_;
    std::map<std::string, FakeTable> tables_;
    std::map<std::string, std::vector<std::string>> samples_;
    std::set<std::string> broken_tables_;
    std::set<std::string> failing_scans_;
    BatchHook hook_;
    std::atomic<bool> unreachable_{false};
    std::atomic<size_t> scans_{0};
    std::atomic<size_t> existing_calls_{0};
};

} // namespace dbsync::testing
