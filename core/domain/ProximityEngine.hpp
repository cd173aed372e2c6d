#pragma once

#include "../Geo.hpp"
#include "../IClock.hpp"
#include "../Presence.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace geoshare::domain {

struct ProximityConfig {
    double thresholdMeters = 500.0;
    std::chrono::milliseconds cooldown{std::chrono::minutes(10)};
};

struct ProximityCooldown {
    std::string peerPairKey;
    Timestamp lastNotifiedAt{};
};

/**
 * @brief Raises "nearby" and geofence events from the peer presence stream.
 *
 * Distances are measured from this device's latest own sample to every online peer.
 * A pair within the threshold notifies once, then stays quiet for the cooldown; the
 * cooldown is cleared as soon as the pair is farther apart than the threshold.
 * Geofences are evaluated against every online peer sample and report transitions only.
 */
class ProximityEngine {
public:
    using ProximityHandler = std::function<void(const ProximityEvent&)>;
    using GeofenceHandler = std::function<void(const GeofenceEvent&)>;

    /// Throws std::invalid_argument for a non-positive threshold or negative cooldown.
    ProximityEngine(std::string ownUserId, std::shared_ptr<IClock> clock, ProximityConfig config = {});

    void setProximityHandler(ProximityHandler handler) { proximityHandler_ = std::move(handler); }
    void setGeofenceHandler(GeofenceHandler handler) { geofenceHandler_ = std::move(handler); }

    std::vector<ProximityEvent> onPeerLocationsChanged(const std::vector<PeerPresenceView>& peers);
    std::vector<ProximityEvent> onOwnLocationChanged(const std::optional<LocationSample>& own);

    /// Returns false if a region with the same id exists or the radius is not positive.
    bool addGeofence(const GeofenceRegion& region);
    bool removeGeofence(const std::string& regionId);
    std::vector<GeofenceRegion> geofences() const;
    
    bool isInside(const std::string& regionId, const std::string& peerId) const;
    std::optional<ProximityCooldown> cooldown(const std::string& peerId) const;

    /// Forgets cooldowns, own location and geofence membership. Regions are kept.
    void reset();
    
    const ProximityConfig& config() const { return config_; }

private:
    std::vector<ProximityEvent> evaluateProximity(Timestamp now);
    void evaluateGeofences(const PeerPresenceView& peer, Timestamp now);
    std::string pairKey(const std::string& peerId) const;

    std::string ownUserId_;
    std::shared_ptr<IClock> clock_;
    ProximityConfig config_;
    
    ProximityHandler proximityHandler_;
    GeofenceHandler geofenceHandler_;
    
    std::optional<LocationSample> ownLocation_;
    std::map<std::string, PeerPresenceView> peers_;
    std::map<std::string, ProximityCooldown> cooldowns_;
    
    std::vector<GeofenceRegion> regions_;
    std::map<std::string, std::set<std::string>> inside_;   ///< regionId -> peers inside
};

} // namespace geoshare::domain
