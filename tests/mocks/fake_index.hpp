#pragma once

#include "index/iindex_sink.hpp"
#include "core/error.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <set>

namespace dbsync::testing {

/**
 * @brief In-memory IIndexSink
 *
 * reject(doc_id, n) makes the next n writes of that document fail.
 */
class FakeIndexSink : public IIndexSink {
public:
    void upsert(const std::string& doc_id, const nlohmann::json& fields,
                DocumentKind kind = DocumentKind::RECORD) override {
        std::lock_guard lock(mutex_);
        ++upserts_;
        check_rejected(doc_id);
        auto& store = kind == DocumentKind::SCHEMA_METADATA ? metadata_ : docs_;
        store[doc_id] = fields;
    }

    void update(const std::string& doc_id, const nlohmann::json& fields) override {
        UpdateHook hook;
        {
            std::lock_guard lock(mutex_);
            hook = update_hook_;
        }
        if (hook) hook(doc_id);

        std::lock_guard lock(mutex_);
        ++updates_;
        if (fail_updates_) throw IndexError("update rejected: " + doc_id);
        auto it = docs_.find(doc_id);
        if (it == docs_.end()) throw IndexError("no such document: " + doc_id);
        for (const auto& [k, v] : fields.items()) it->second[k] = v;
    }

    void remove(const std::string& doc_id) override {
        std::lock_guard lock(mutex_);
        removed_.insert(doc_id);
        docs_.erase(doc_id);
    }

    std::vector<std::string> sample_source_ids(const std::string& table, size_t limit) override {
        std::lock_guard lock(mutex_);
        if (fail_sampling_) throw IndexError("visit failed");
        std::vector<std::string> ids;
        const auto prefix = table + ":";
        for (const auto& [doc_id, fields] : docs_) {
            if (ids.size() >= limit) break;
            if (doc_id.starts_with(prefix)) ids.push_back(doc_id.substr(prefix.size()));
        }
        return ids;
    }

    std::string name() const override { return "fake"; }

    // ========================================================================
    // Test controls
    // ========================================================================

    // Called on the writer's thread before each update is applied
    using UpdateHook = std::function<void(const std::string& doc_id)>;
    void on_update(UpdateHook hook) {
        std::lock_guard lock(mutex_);
        update_hook_ = std::move(hook);
    }

    void reject(const std::string& doc_id, int times) {
        std::lock_guard lock(mutex_);
        rejections_[doc_id] = times;
    }

    void fail_updates(bool v) {
        std::lock_guard lock(mutex_);
        fail_updates_ = v;
    }

    void fail_sampling(bool v) {
        std::lock_guard lock(mutex_);
        fail_sampling_ = v;
    }

    // Seed a document as if an earlier run had indexed it
    void put(const std::string& doc_id, nlohmann::json fields = nlohmann::json::object()) {
        std::lock_guard lock(mutex_);
        docs_[doc_id] = std::move(fields);
    }

    [[nodiscard]] bool contains(const std::string& doc_id) const {
        std::lock_guard lock(mutex_);
        return docs_.contains(doc_id);
    }

    [[nodiscard]] nlohmann::json doc(const std::string& doc_id) const {
        std::lock_guard lock(mutex_);
        const auto it = docs_.find(doc_id);
        return it == docs_.end() ? nlohmann::json() : it->second;
    }

    [[nodiscard]] nlohmann::json metadata_doc(const std::string& doc_id) const {
        std::lock_guard lock(mutex_);
        const auto it = metadata_.find(doc_id);
        return it == metadata_.end() ? nlohmann::json() : it->second;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return docs_.size();
    }

    [[nodiscard]] size_t metadata_count() const {
        std::lock_guard lock(mutex_);
        return metadata_.size();
    }

    [[nodiscard]] size_t upsert_count() const {
        std::lock_guard lock(mutex_);
        return upserts_;
    }

    [[nodiscard]] size_t update_count() const {
        std::lock_guard lock(mutex_);
        return updates_;
    }

    [[nodiscard]] std::set<std::string> removed() const {
        std::lock_guard lock(mutex_);
        return removed_;
    }

    // Every record document, fields minus the per-run ingestion time
    [[nodiscard]] std::map<std::string, nlohmann::json> snapshot() const {
        std::lock_guard lock(mutex_);
        auto out = docs_;
        for (auto& [id, fields] : out) fields.erase("ingested_at");
        return out;
    }

private:
    void check_rejected(const std::string& doc_id) {
        auto it = rejections_.find(doc_id);
        if (it == rejections_.end() || it->second <= 0) return;
        --it->second;
        throw IndexError("document rejected: " + doc_id);
    }

    mutable std::mutex mutex_;
    std::map<std::string, nlohmann::json> docs_;
    std::map<std::string, nlohmann::json> metadata_;
    std::map<std::string, int> rejections_;
    std::set<std::string> removed_;
    UpdateHook update_hook_;
    size_t upserts_ = 0;
    size_t updates_ = 0;
    bool fail_updates_ = false;
    bool fail_sampling_ = false;
};

} // namespace dbsync::testing
