#include "ProximityEngine.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace geoshare::domain {

ProximityEngine::ProximityEngine(std::string ownUserId, std::shared_ptr<IClock> clock, ProximityConfig config)
    : ownUserId_(std::move(ownUserId)), clock_(std::move(clock)), config_(config) {
    if (!clock_) {
        throw std::invalid_argument("ProximityEngine requires a clock");
    }
    if (!std::isfinite(config_.thresholdMeters) || config_.thresholdMeters <= 0.0) {
        throw std::invalid_argument("Proximity threshold must be a positive distance");
    }
    if (config_.cooldown.count() < 0) {
        throw std::invalid_argument("Proximity cooldown must not be negative");
    }
}

std::vector<ProximityEvent> ProximityEngine::onPeerLocationsChanged(const std::vector<PeerPresenceView>& peers) {
    auto now = clock_->now();
    
    for (const auto& peer : peers) {
        if (peer.userId.empty() || peer.userId == ownUserId_) continue;
        peers_[peer.userId] = peer;
        evaluateGeofences(peer, now);
    }
    
    return evaluateProximity(now);
}

std::vector<ProximityEvent> ProximityEngine::onOwnLocationChanged(const std::optional<LocationSample>& own) {
    ownLocation_ = own;
    return evaluateProximity(clock_->now());
}

bool ProximityEngine::addGeofence(const GeofenceRegion& region) {
    if (region.id.empty() || !(region.radiusMeters > 0.0)) {
        std::cerr << "[Proximity] Rejecting geofence '" << region.id << "'" << std::endl;
        return false;
    }
    auto it = std::find_if(regions_.begin(), regions_.end(),
                           [&](const GeofenceRegion& r) { return r.id == region.id; });
    if (it != regions_.end()) return false;
    
    regions_.push_back(region);
    std::cout << "[Proximity] Geofence added: " << region.id << " (" << region.label << ", "
              << Geo::formatDistance(region.radiusMeters) << ")" << std::endl;
    return true;
}

bool ProximityEngine::removeGeofence(const std::string& regionId) {
    auto it = std::find_if(regions_.begin(), regions_.end(),
                           [&](const GeofenceRegion& r) { return r.id == regionId; });
    if (it == regions_.end()) return false;
    
    regions_.erase(it);
    inside_.erase(regionId);
    return true;
}

std::vector<GeofenceRegion> ProximityEngine::geofences() const {
    return regions_;
}

bool ProximityEngine::isInside(const std::string& regionId, const std::string& peerId) const {
    auto it = inside_.find(regionId);
    return it != inside_.end() && it->second.count(peerId) > 0;
}

std::optional<ProximityCooldown> ProximityEngine::cooldown(const std::string& peerId) const {
    auto it = cooldowns_.find(peerId);
    if (it == cooldowns_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ProximityEngine::reset() {
    ownLocation_.reset();
    peers_.clear();
    cooldowns_.clear();
    inside_.clear();
}

std::vector<ProximityEvent> ProximityEngine::evaluateProximity(Timestamp now) {
    std::vector<ProximityEvent> events;
    if (!ownLocation_) return events;
    
    for (const auto& [peerId, peer] : peers_) {
        if (!peer.isOnline || !peer.location) continue;
        
        double distance = Geo::distanceMeters(*ownLocation_, *peer.location);
        if (distance > config_.thresholdMeters) {
            if (cooldowns_.erase(peerId) > 0) {
                std::cout << "[Proximity] " << peerId << " moved away (" << Geo::formatDistance(distance) << ")" << std::endl;
            }
            continue;
        }
        
        auto it = cooldowns_.find(peerId);
        if (it != cooldowns_.end() && now - it->second.lastNotifiedAt < config_.cooldown) continue;
        
        cooldowns_[peerId] = ProximityCooldown{pairKey(peerId), now};
        
        ProximityEvent event;
        event.peerId = peerId;
        event.distanceMeters = distance;
        event.at = now;
        events.push_back(event);
        
        std::cout << "[Proximity] " << peerId << " is nearby (" << Geo::formatDistance(distance) << ")" << std::endl;
    }
    
    if (proximityHandler_) {
        for (const auto& event : events) {
            proximityHandler_(event);
        }
    }
    return events;
}

void ProximityEngine::evaluateGeofences(const PeerPresenceView& peer, Timestamp now) {
    if (!peer.isOnline || !peer.location) return;
    
    GeoPoint point{peer.location->lat, peer.location->lng};
    for (const auto& region : regions_) {
        bool inside = Geo::isInsideRegion(point, region);
        auto& members = inside_[region.id];
        bool wasInside = members.count(peer.userId) > 0;
        if (inside == wasInside) continue;
        
        if (inside) {
            members.insert(peer.userId);
        } else {
            members.erase(peer.userId);
        }
        
        GeofenceEvent event;
        event.regionId = region.id;
        event.label = region.label;
        event.peerId = peer.userId;
        event.entered = inside;
        event.at = now;
        
        std::cout << "[Proximity] " << peer.userId << (inside ? " entered " : " left ") << region.label << std::endl;
        if (geofenceHandler_) {
            geofenceHandler_(event);
        }
    }
}

std::string ProximityEngine::pairKey(const std::string& peerId) const {
    return ownUserId_ < peerId ? ownUserId_ + "|" + peerId : peerId + "|" + ownUserId_;
}

} // namespace geoshare::domain
