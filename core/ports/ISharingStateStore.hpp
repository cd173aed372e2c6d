#pragma once

#include <optional>
#include <string>

namespace geoshare::ports {

/// The user's last sharing choice, kept across process restarts.
struct PersistedSharingState {
    std::string userId;
    bool sharingEnabled = false;
    
    bool operator==(const PersistedSharingState& other) const {
        return userId == other.userId && sharingEnabled == other.sharingEnabled;
    }
};

/// Device-local storage for the sharing choice. Calls may come from any thread.
class ISharingStateStore {
public:
    virtual ~ISharingStateStore() = default;
    
    /// Empty when nothing was saved or the saved data is unreadable.
    virtual std::optional<PersistedSharingState> load() = 0;
    
    /// Returns false if the state could not be written.
    virtual bool save(const PersistedSharingState& state) = 0;
};

} // namespace geoshare::ports
