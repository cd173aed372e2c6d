#pragma once

#include "../ports/ISharingStateStore.hpp"
#include <mutex>
#include <optional>

namespace geoshare::sim {

/// Keeps the sharing choice in memory; outlives the services that use it in tests.
class InMemorySharingStateStore : public ports::ISharingStateStore {
public:
    std::optional<ports::PersistedSharingState> load() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }
    
    bool save(const ports::PersistedSharingState& state) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++saveCount_;
        if (failSaves_) return false;
        state_ = state;
        return true;
    }
    
    void setFailSaves(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        failSaves_ = fail;
    }
    
    int saveCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return saveCount_;
    }

private:
    mutable std::mutex mutex_;
    std::optional<ports::PersistedSharingState> state_;
    bool failSaves_ = false;
    int saveCount_ = 0;
};

} // namespace geoshare::sim
