#pragma once

#include "../Presence.hpp"

namespace geoshare::ports {

/// Hand-off point for user-facing events. Rendering and delivery are not the core's concern.
class INotificationSink {
public:
    virtual ~INotificationSink() = default;
    
    virtual void onProximity(const ProximityEvent& event) = 0;
    virtual void onGeofenceTransition(const GeofenceEvent& event) = 0;
    virtual void onTrackingStatus(const TrackingStatusEvent& event) = 0;
};

} // namespace geoshare::ports
