#pragma once

#include "Sampling.hpp"
#include "TrackingError.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace geoshare {

/// Whether the publisher currently has a working tracking strategy.
enum class PresenceStatus {
    Ok,
    Degraded
};

/**
 * @brief Authoritative shared-store record for one user.
 *
 * Written only by that user's own PresenceSyncEngine.
 * Invariant: isSharingEnabled == false implies lastSample is empty.
 */
struct PublishedPresence {
    std::string userId;
    std::optional<LocationSample> lastSample;
    bool isSharingEnabled = false;
    Timestamp lastHeartbeatAt{};
    PresenceStatus status = PresenceStatus::Ok;
    uint64_t revision = 0;                  ///< Monotonic per writer, compared before overwrite
};

/// Locally derived view of one peer. Never persisted.
struct PeerPresenceView {
    std::string userId;
    bool isOnline = false;
    std::optional<LocationSample> location;  ///< Empty whenever isOnline is false
    bool isSharingEnabled = false;
    bool trackingDegraded = false;
    std::optional<Timestamp> lastSeenAt;
};

bool operator==(const PeerPresenceView& a, const PeerPresenceView& b);
bool operator!=(const PeerPresenceView& a, const PeerPresenceView& b);

enum class TrackingState {
    Idle,
    Starting,
    Running,
    Recovering,
    Degraded,
    Stopped
};

/// Reported by the tracking coordinator whenever its externally visible state changes.
struct TrackingStatusEvent {
    TrackingState state = TrackingState::Idle;
    std::string strategy;                   ///< Active or attempted strategy, may be empty
    TrackingError reason = TrackingError::None;
    std::string message;
    Timestamp at{};
};

struct ProximityEvent {
    std::string peerId;
    double distanceMeters = 0.0;
    Timestamp at{};
};

struct GeofenceEvent {
    std::string regionId;
    std::string label;
    std::string peerId;
    bool entered = false;
    Timestamp at{};
};

std::string presenceKey(const std::string& userId);

/// Returns the user id for a "presence/{userId}" key, or empty for any other key.
std::string userIdFromPresenceKey(const std::string& key);

std::string presenceStatusToString(PresenceStatus status);
PresenceStatus stringToPresenceStatus(const std::string& str);

std::string trackingStateToString(TrackingState state);

/// Human readable presence line, e.g. "Sharing location" or "Location 5 min ago".
std::string lastSeenText(const PeerPresenceView& view, Timestamp now);

} // namespace geoshare
