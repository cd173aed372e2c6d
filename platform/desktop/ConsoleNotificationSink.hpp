#pragma once

#include "Geo.hpp"
#include "IClock.hpp"
#include "ports/INotificationSink.hpp"
#include <iostream>
#include <mutex>

namespace geoshare {

/// Prints user-facing events to the terminal.
class ConsoleNotificationSink : public ports::INotificationSink {
public:
    ConsoleNotificationSink() = default;

    void onProximity(const ProximityEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "[Notify] " << event.peerId << " is nearby ("
                  << Geo::formatDistance(event.distanceMeters) << ")" << std::endl;
    }

    void onGeofenceTransition(const GeofenceEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "[Notify] " << event.peerId << (event.entered ? " arrived at " : " left ")
                  << (event.label.empty() ? event.regionId : event.label) << std::endl;
    }

    void onTrackingStatus(const TrackingStatusEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "[Tracking] " << formatIso8601(event.at) << " " << trackingStateToString(event.state);
        if (!event.strategy.empty()) {
            std::cout << " via " << event.strategy;
        }
        if (event.reason != TrackingError::None) {
            std::cout << " (" << trackingErrorToString(event.reason) << ")";
        }
        if (!event.message.empty()) {
            std::cout << ": " << event.message;
        }
        std::cout << std::endl;
    }

private:
    std::mutex mutex_;
};

} // namespace geoshare
