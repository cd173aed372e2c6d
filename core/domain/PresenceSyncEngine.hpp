#pragma once

#include "../IClock.hpp"
#include "../Presence.hpp"
#include "../TrackingError.hpp"
#include "../ports/IPolicyEngine.hpp"
#include "../ports/ISharedLocationStore.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace geoshare::domain {

struct PresenceConfig {
    std::chrono::milliseconds heartbeatInterval{std::chrono::seconds(30)};
    std::chrono::milliseconds stalenessThreshold{std::chrono::seconds(120)};
    std::chrono::milliseconds sweepInterval{std::chrono::seconds(15)};
};

/**
 * @brief Publishes this user's presence record and derives peer liveness.
 *
 * Write side: every write replaces the whole presence/{userId} record. Sharing is
 * gated: beginSharing() opens the gate, publish(nullopt, false) closes it and clears
 * the published location in the same write, and a publish of a sample while the gate
 * is closed is rejected. Failed writes keep a single pending slot that is retried
 * with the publish retry policy; a newer write replaces it.
 *
 * Read side: peers are online while sharing is enabled and their last heartbeat is
 * younger than the staleness threshold, evaluated on arrival and by a periodic sweep.
 * Older revisions are discarded and future heartbeats are clamped to local time.
 */
class PresenceSyncEngine {
public:
    using PeerViewHandler = std::function<void(const PeerPresenceView&)>;
    using PeerMap = std::map<std::string, PeerPresenceView>;
    using Snapshot = std::shared_ptr<const PeerMap>;

    /// Throws std::invalid_argument unless 0 < 2 * heartbeat < staleness and sweep > 0.
    PresenceSyncEngine(std::shared_ptr<ports::ISharedLocationStore> store,
                       std::shared_ptr<ports::IPolicyEngine> policyEngine,
                       std::shared_ptr<IClock> clock,
                       PresenceConfig config = {});
    ~PresenceSyncEngine();
    
    PresenceSyncEngine(const PresenceSyncEngine&) = delete;
    PresenceSyncEngine& operator=(const PresenceSyncEngine&) = delete;

    /// Binds the engine to the local user. Throws std::invalid_argument for an empty id.
    void start(const std::string& userId);
    void stop();

    void beginSharing();
    TrackingResult publish(const std::optional<LocationSample>& sample, bool sharingEnabled);
    TrackingResult sendHeartbeat();
    
    /// Removes the presence record entirely (sign-out).
    TrackingResult withdraw();

    TrackingResult subscribeAll(PeerViewHandler handler);
    void unsubscribeAll();

    /// Re-derives every peer view against the current time.
    void sweep();
    
    /// Drives heartbeat, sweep and pending-write timers.
    void tick();

    void setTrackingDegraded(bool degraded);
    void setPublishDeferred(bool deferred);

    Snapshot snapshot() const;
    std::optional<PeerPresenceView> peer(const std::string& userId) const;
    
    bool isSharing() const;
    bool isTrackingDegraded() const;
    bool hasPendingWrite() const;
    std::optional<PublishedPresence> lastPublished() const;
    const PresenceConfig& config() const { return config_; }

private:
    struct PendingWrite {
        std::optional<PublishedPresence> record;   ///< Empty means remove
        int attempts = 0;
        Timestamp nextAttemptAt{};
    };
    
    using Changes = std::vector<PeerPresenceView>;

    PublishedPresence buildRecordLocked(Timestamp now);
    TrackingResult writeLocked(std::optional<PublishedPresence> record, Timestamp now);
    bool putLocked(const std::optional<PublishedPresence>& record);
    void retryPendingLocked(Timestamp now);
    
    void onStoreValue(const std::string& key, const std::optional<std::string>& value);
    PeerPresenceView deriveViewLocked(const PublishedPresence& record, Timestamp now) const;
    void applyViewLocked(const PeerPresenceView& view, Changes& changes);
    void eraseViewLocked(const std::string& userId, Changes& changes);
    void sweepLocked(Timestamp now, Changes& changes);
    void notify(const Changes& changes);

    std::shared_ptr<ports::ISharedLocationStore> store_;
    std::shared_ptr<ports::IPolicyEngine> policyEngine_;
    std::shared_ptr<IClock> clock_;
    PresenceConfig config_;
    
    mutable std::mutex mutex_;
    std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);
    std::string userId_;
    
    // Write side
    bool sharing_ = false;
    bool degraded_ = false;
    bool deferred_ = false;
    std::optional<LocationSample> lastSample_;
    std::optional<PublishedPresence> lastPublished_;
    std::optional<PendingWrite> pending_;
    uint64_t revision_ = 0;
    Timestamp lastHeartbeatAt_{};
    
    // Read side
    ports::ISharedLocationStore::SubscriptionId subscription_ = ports::ISharedLocationStore::kInvalidSubscription;
    PeerViewHandler peerHandler_;
    std::map<std::string, PublishedPresence> records_;
    Snapshot views_ = std::make_shared<const PeerMap>();
    Timestamp nextSweepAt_{};
};

} // namespace geoshare::domain
