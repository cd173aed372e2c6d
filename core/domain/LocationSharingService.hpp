#pragma once

#include "BatteryAdaptationPolicy.hpp"
#include "PresenceSyncEngine.hpp"
#include "ProximityEngine.hpp"
#include "StrategySelector.hpp"
#include "../IClock.hpp"
#include "../ports/IDispatcher.hpp"
#include "../ports/ILocationPermissions.hpp"
#include "../ports/INotificationSink.hpp"
#include "../ports/IPolicyEngine.hpp"
#include "../ports/IPowerExemption.hpp"
#include "../ports/ISharedLocationStore.hpp"
#include "../ports/ISharingStateStore.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace geoshare::domain {

struct SharingConfig {
    std::string userId;
    DevicePowerProfile deviceProfile;
    
    StrategySelectorConfig tracking;
    PresenceConfig presence;
    ProximityConfig proximity;
    
    std::vector<GeofenceRegion> geofences;
};

/**
 * @brief Location sharing for one signed-in user on one device.
 *
 * Wires the tracking coordinator, the presence engine and the proximity engine
 * together: samples flow to the store, peer views flow to proximity evaluation,
 * and everything user-facing goes to the notification sink.
 *
 * When a state store is given, the user's sharing choice is saved on every explicit
 * change and resumeIfEnabled() restores it after a restart. Process shutdown uses
 * suspendSharing(), which stops publishing without forgetting the choice.
 *
 * Apart from disableSharing(), which may be called from any thread, methods are
 * expected to run on the worker that drains the dispatcher.
 */
class LocationSharingService {
public:
    using PeerViewHandler = PresenceSyncEngine::PeerViewHandler;

    LocationSharingService(SharingConfig config,
                           std::vector<TrackingStrategy> strategies,
                           std::shared_ptr<ports::ISharedLocationStore> store,
                           std::shared_ptr<ports::ILocationPermissions> permissions,
                           std::shared_ptr<ports::IPolicyEngine> policyEngine,
                           std::shared_ptr<ports::IDispatcher> dispatcher,
                           std::shared_ptr<IClock> clock,
                           std::shared_ptr<ports::INotificationSink> notifications = nullptr,
                           std::shared_ptr<ports::IPowerExemption> powerExemption = nullptr,
                           std::shared_ptr<ports::ISharingStateStore> stateStore = nullptr);
    ~LocationSharingService();

    /// Binds the presence engine to the user and starts following peers.
    TrackingResult start();
    void stop();

    TrackingResult enableSharing();
    void disableSharing();
    void signOut();

    /// Re-enables sharing if this user left it on before the last shutdown.
    TrackingResult resumeIfEnabled();
    /// Stops publishing and clears the shared location, but keeps the saved choice.
    void suspendSharing();

    void updatePowerState(const PowerState& power);
    void tick();

    void setPeerViewHandler(PeerViewHandler handler) { peerHandler_ = std::move(handler); }

    bool isSharing() const { return sharing_.load(); }
    TrackingState trackingState() const { return selector_->state(); }
    SamplingParameters samplingParameters() const { return params_; }
    PresenceSyncEngine::Snapshot peers() const { return presence_->snapshot(); }

    StrategySelector& tracking() { return *selector_; }
    PresenceSyncEngine& presence() { return *presence_; }
    ProximityEngine& proximity() { return *proximity_; }

private:
    void onLocationSample(const LocationSample& sample);
    void onTrackingStatus(const TrackingStatusEvent& event);
    void onPeerView(const PeerPresenceView& view);
    void requestExemptionOnce();
    bool stopSharing();
    void saveSharingChoice(bool enabled);

    SharingConfig config_;
    std::shared_ptr<ports::ISharedLocationStore> store_;
    std::shared_ptr<ports::IPolicyEngine> policyEngine_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<ports::INotificationSink> notifications_;
    std::shared_ptr<ports::IPowerExemption> powerExemption_;
    std::shared_ptr<ports::ISharingStateStore> stateStore_;
    
    std::unique_ptr<StrategySelector> selector_;
    std::unique_ptr<PresenceSyncEngine> presence_;
    std::unique_ptr<ProximityEngine> proximity_;
    
    PeerViewHandler peerHandler_;
    
    bool started_ = false;
    std::atomic<bool> sharing_{false};
    bool exemptionRequested_ = false;
    
    PowerState power_;
    SamplingParameters params_;
    std::optional<LocationSample> lastPublishedSample_;
};

} // namespace geoshare::domain
