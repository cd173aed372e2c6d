#include "LocationSharingService.hpp"
#include "../Geo.hpp"
#include <iostream>
#include <stdexcept>

namespace geoshare::domain {

LocationSharingService::LocationSharingService(SharingConfig config,
                                               std::vector<TrackingStrategy> strategies,
                                               std::shared_ptr<ports::ISharedLocationStore> store,
                                               std::shared_ptr<ports::ILocationPermissions> permissions,
                                               std::shared_ptr<ports::IPolicyEngine> policyEngine,
                                               std::shared_ptr<ports::IDispatcher> dispatcher,
                                               std::shared_ptr<IClock> clock,
                                               std::shared_ptr<ports::INotificationSink> notifications,
                                               std::shared_ptr<ports::IPowerExemption> powerExemption,
                                               std::shared_ptr<ports::ISharingStateStore> stateStore)
    : config_(std::move(config)),
      store_(store),
      policyEngine_(policyEngine),
      clock_(clock),
      notifications_(std::move(notifications)),
      powerExemption_(std::move(powerExemption)),
      stateStore_(std::move(stateStore)) {
    if (config_.userId.empty()) {
        throw std::invalid_argument("LocationSharingService requires a user id");
    }
    if (!store_ || !policyEngine_ || !clock_) {
        throw std::invalid_argument("LocationSharingService requires store, policy engine and clock");
    }
    
    selector_ = std::make_unique<StrategySelector>(std::move(strategies), std::move(dispatcher),
                                                   std::move(permissions), policyEngine_, clock_,
                                                   config_.tracking);
    presence_ = std::make_unique<PresenceSyncEngine>(store_, policyEngine_, clock_, config_.presence);
    proximity_ = std::make_unique<ProximityEngine>(config_.userId, clock_, config_.proximity);
    
    for (const auto& region : config_.geofences) {
        proximity_->addGeofence(region);
    }
    
    params_ = policyEngine_->getSamplingPolicy().evaluate(power_);
    
    selector_->setSampleHandler([this](const LocationSample& sample) {
        onLocationSample(sample);
    });
    selector_->setStatusHandler([this](const TrackingStatusEvent& event) {
        onTrackingStatus(event);
    });
    proximity_->setProximityHandler([this](const ProximityEvent& event) {
        if (notifications_) notifications_->onProximity(event);
    });
    proximity_->setGeofenceHandler([this](const GeofenceEvent& event) {
        if (notifications_) notifications_->onGeofenceTransition(event);
    });
}

LocationSharingService::~LocationSharingService() {
    selector_->stop();
}

TrackingResult LocationSharingService::start() {
    if (started_) {
        return TrackingResult::success();
    }
    
    try {
        presence_->start(config_.userId);
    } catch (const std::invalid_argument& e) {
        return TrackingResult::failure(TrackingError::InvalidArgument, e.what());
    }
    
    auto result = presence_->subscribeAll([this](const PeerPresenceView& view) {
        onPeerView(view);
    });
    if (!result) {
        return result;
    }
    
    started_ = true;
    std::cout << "[Sharing] " << config_.userId << " following peers" << std::endl;
    return TrackingResult::success();
}

void LocationSharingService::stop() {
    selector_->stop();
    presence_->stop();
    sharing_.store(false);
    started_ = false;
}

TrackingResult LocationSharingService::enableSharing() {
    if (sharing_.load()) {
        return TrackingResult::success();
    }
    
    auto started = start();
    if (!started) {
        return started;
    }
    
    requestExemptionOnce();
    lastPublishedSample_.reset();
    presence_->beginSharing();
    
    auto result = selector_->start(config_.userId, params_);
    if (!result) {
        std::cerr << "[Sharing] Cannot enable sharing: " << result.message << std::endl;
        auto cleared = presence_->publish(std::nullopt, false);
        if (!cleared) {
            std::cerr << "[Sharing] Clearing presence failed: " << cleared.message << std::endl;
        }
        return result;
    }
    
    sharing_.store(true);
    saveSharingChoice(true);
    std::cout << "[Sharing] Sharing enabled for " << config_.userId << std::endl;
    
    // Announce sharing before the first fix arrives
    auto heartbeat = presence_->sendHeartbeat();
    if (!heartbeat && heartbeat.error != TrackingError::AllStrategiesExhausted) {
        std::cerr << "[Sharing] Initial heartbeat failed: " << heartbeat.message << std::endl;
    }
    return TrackingResult::success();
}

void LocationSharingService::disableSharing() {
    saveSharingChoice(false);
    if (stopSharing()) {
        std::cout << "[Sharing] Sharing disabled for " << config_.userId << std::endl;
    }
}

void LocationSharingService::suspendSharing() {
    if (stopSharing()) {
        std::cout << "[Sharing] Sharing suspended for " << config_.userId << std::endl;
    }
}

bool LocationSharingService::stopSharing() {
    if (!sharing_.exchange(false)) return false;
    
    // Closing the publish gate first rejects samples still in flight
    auto result = presence_->publish(std::nullopt, false);
    if (!result) {
        std::cerr << "[Sharing] Clearing presence failed: " << result.message << std::endl;
    }
    selector_->stop();
    return true;
}

TrackingResult LocationSharingService::resumeIfEnabled() {
    if (!stateStore_ || sharing_.load()) {
        return TrackingResult::success();
    }
    
    auto saved = stateStore_->load();
    if (!saved || !saved->sharingEnabled) {
        return TrackingResult::success();
    }
    if (saved->userId != config_.userId) {
        std::cout << "[Sharing] Saved sharing choice belongs to " << saved->userId << ", not resuming" << std::endl;
        return TrackingResult::success();
    }
    
    std::cout << "[Sharing] Resuming sharing for " << config_.userId << std::endl;
    auto result = enableSharing();
    if (!result && isSessionFatal(result.error)) {
        saveSharingChoice(false);
    }
    return result;
}

void LocationSharingService::saveSharingChoice(bool enabled) {
    if (!stateStore_) return;
    if (!stateStore_->save(ports::PersistedSharingState{config_.userId, enabled})) {
        std::cerr << "[Sharing] Could not save sharing choice for " << config_.userId << std::endl;
    }
}

void LocationSharingService::signOut() {
    disableSharing();
    
    if (started_) {
        auto result = presence_->withdraw();
        if (!result) {
            std::cerr << "[Sharing] Withdrawing presence failed: " << result.message << std::endl;
        }
    }
    presence_->stop();
    proximity_->reset();
    started_ = false;
    std::cout << "[Sharing] " << config_.userId << " signed out" << std::endl;
}

void LocationSharingService::updatePowerState(const PowerState& power) {
    power_ = power;
    auto params = policyEngine_->getSamplingPolicy().evaluate(power);
    if (params == params_) return;
    
    params_ = params;
    std::cout << "[Sharing] Power " << power.batteryLevel << "%" << (power.isCharging ? " charging" : "")
              << (power.isPowerSaveMode ? " saver" : "") << ", network " << networkClassToString(power.network)
              << " -> interval " << params_.sampleInterval.count() << "ms" << std::endl;
    
    selector_->reconfigure(params_);
    presence_->setPublishDeferred(params_.publishDeferred);
}

void LocationSharingService::tick() {
    store_->processEvents();
    selector_->tick();
    presence_->tick();
}

void LocationSharingService::onLocationSample(const LocationSample& sample) {
    proximity_->onOwnLocationChanged(sample);
    
    // Heartbeats keep presence fresh while the user stays within the displacement filter
    if (lastPublishedSample_ &&
        Geo::distanceMeters(*lastPublishedSample_, sample) < params_.minDisplacementMeters) {
        return;
    }
    
    auto result = presence_->publish(sample, true);
    if (result) {
        lastPublishedSample_ = sample;
    } else {
        std::cerr << "[Sharing] Sample not published: " << result.message << std::endl;
    }
}

void LocationSharingService::onTrackingStatus(const TrackingStatusEvent& event) {
    if (event.state == TrackingState::Degraded) {
        presence_->setTrackingDegraded(true);
    } else if (event.state == TrackingState::Running) {
        presence_->setTrackingDegraded(false);
    }
    
    if (isSessionFatal(event.reason) && sharing_.exchange(false)) {
        std::cerr << "[Sharing] Location permission lost, sharing stopped" << std::endl;
        saveSharingChoice(false);
        auto result = presence_->publish(std::nullopt, false);
        if (!result) {
            std::cerr << "[Sharing] Clearing presence failed: " << result.message << std::endl;
        }
    }
    
    if (notifications_) {
        notifications_->onTrackingStatus(event);
    }
}

void LocationSharingService::onPeerView(const PeerPresenceView& view) {
    proximity_->onPeerLocationsChanged({view});
    if (peerHandler_) {
        peerHandler_(view);
    }
}

void LocationSharingService::requestExemptionOnce() {
    if (exemptionRequested_ || !config_.deviceProfile.requestExemption || !powerExemption_) return;
    
    exemptionRequested_ = true;
    if (powerExemption_->requestExemption(config_.deviceProfile.manufacturer)) {
        std::cout << "[Sharing] Battery optimisation exemption granted" << std::endl;
    } else {
        std::cerr << "[Sharing] Battery optimisation exemption refused for "
                  << config_.deviceProfile.manufacturer << std::endl;
    }
}

} // namespace geoshare::domain
