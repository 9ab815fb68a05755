#pragma once

#include "index/iindex_sink.hpp"

#include <atomic>
#include <cstdint>

namespace dbsync {

/**
 * @brief IIndexSink for commands that never write to the index
 *
 * Used by dry runs, status and reset so they work without a reachable
 * (or even configured) index endpoint. Writes are counted and dropped.
 */
class DiscardIndexSink : public IIndexSink {
public:
    void upsert(const std::string&, const nlohmann::json&,
                DocumentKind = DocumentKind::RECORD) override { ++writes_; }
    void update(const std::string&, const nlohmann::json&) override { ++writes_; }
    void remove(const std::string&) override { ++writes_; }

    [[nodiscard]] std::vector<std::string> sample_source_ids(const std::string&, size_t) override {
        return {};
    }

    [[nodiscard]] std::string name() const override { return "discard"; }

    [[nodiscard]] uint64_t writes_dropped() const { return writes_.load(); }

private:
    std::atomic<uint64_t> writes_{0};
};

} // namespace dbsync
