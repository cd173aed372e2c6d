#include "Presence.hpp"

namespace geoshare {

namespace {

const std::string kPresencePrefix = "presence/";

bool sameSample(const std::optional<LocationSample>& a, const std::optional<LocationSample>& b) {
    if (a.has_value() != b.has_value()) return false;
    if (!a) return true;
    return a->lat == b->lat && a->lng == b->lng &&
           a->accuracyMeters == b->accuracyMeters &&
           a->capturedAt == b->capturedAt && a->source == b->source;
}

} // namespace

bool operator==(const PeerPresenceView& a, const PeerPresenceView& b) {
    return a.userId == b.userId &&
           a.isOnline == b.isOnline &&
           a.isSharingEnabled == b.isSharingEnabled &&
           a.trackingDegraded == b.trackingDegraded &&
           a.lastSeenAt == b.lastSeenAt &&
           sameSample(a.location, b.location);
}

bool operator!=(const PeerPresenceView& a, const PeerPresenceView& b) {
    return !(a == b);
}

std::string presenceKey(const std::string& userId) {
    return kPresencePrefix + userId;
}

std::string userIdFromPresenceKey(const std::string& key) {
    if (key.size() <= kPresencePrefix.size() || key.compare(0, kPresencePrefix.size(), kPresencePrefix) != 0) {
        return "";
    }
    std::string userId = key.substr(kPresencePrefix.size());
    if (userId.find('/') != std::string::npos) {
        return "";
    }
    return userId;
}

std::string presenceStatusToString(PresenceStatus status) {
    return status == PresenceStatus::Degraded ? "degraded" : "ok";
}

PresenceStatus stringToPresenceStatus(const std::string& str) {
    return str == "degraded" ? PresenceStatus::Degraded : PresenceStatus::Ok;
}

std::string trackingStateToString(TrackingState state) {
    switch (state) {
        case TrackingState::Idle: return "Idle";
        case TrackingState::Starting: return "Starting";
        case TrackingState::Running: return "Running";
        case TrackingState::Recovering: return "Recovering";
        case TrackingState::Degraded: return "Degraded";
        case TrackingState::Stopped: return "Stopped";
        default: return "Unknown";
    }
}

std::string lastSeenText(const PeerPresenceView& view, Timestamp now) {
    if (!view.isSharingEnabled) {
        return "Location not shared";
    }
    
    if (view.isOnline) {
        return view.trackingDegraded ? "Sharing enabled, no recent fix" : "Sharing location";
    }
    
    if (!view.lastSeenAt) {
        return "Location never updated";
    }
    
    auto elapsed = now - *view.lastSeenAt;
    auto minutes = std::chrono::duration_cast<std::chrono::minutes>(elapsed).count();
    
    if (minutes < 1) {
        return "Location updated just now";
    } else if (minutes < 60) {
        return "Location " + std::to_string(minutes) + " min ago";
    } else if (minutes < 24 * 60) {
        return "Location " + std::to_string(minutes / 60) + " hr ago";
    }
    return "Location " + std::to_string(minutes / (24 * 60)) + " days ago";
}

} // namespace geoshare
