#pragma once

#include "files/iobject_store.hpp"

#include <future>
#include <mutex>
#include <ostream>

namespace dbsync::testing {

// Holds every fetch until release() is called
class GatedObjectStore : public IObjectStore {
public:
    FetchResult fetch(const std::string&, std::ostream& out, uint64_t) override {
        {
            std::lock_guard lock(mutex_);
            if (!entered_set_) {
                entered_set_ = true;
                entered_.set_value();
            }
        }
        gate_.wait();
        out << "x";
        FetchResult r;
        r.status = FetchStatus::OK;
        r.bytes = 1;
        return r;
    }
    std::string name() const override { return "gated"; }

    void wait_entered() { entered_.get_future().wait(); }
    void release() { release_.set_value(); }

private:
    std::mutex mutex_;
    bool entered_set_ = false;
    std::promise<void> entered_;
    std::promise<void> release_;
    std::shared_future<void> gate_ = release_.get_future().share();
};

} // namespace dbsync::testing
