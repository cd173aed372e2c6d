#include "PresenceSyncEngine.hpp"
#include "../JsonCodec.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace geoshare::domain {

namespace {

const std::string kPresencePattern = "presence/+";

long long toSeconds(std::chrono::milliseconds duration) {
    return std::chrono::duration_cast<std::chrono::seconds>(duration).count();
}

} // namespace

PresenceSyncEngine::PresenceSyncEngine(std::shared_ptr<ports::ISharedLocationStore> store,
                                       std::shared_ptr<ports::IPolicyEngine> policyEngine,
                                       std::shared_ptr<IClock> clock,
                                       PresenceConfig config)
    : store_(std::move(store)),
      policyEngine_(std::move(policyEngine)),
      clock_(std::move(clock)),
      config_(config) {
    if (!store_ || !policyEngine_ || !clock_) {
        throw std::invalid_argument("PresenceSyncEngine requires store, policy engine and clock");
    }
    if (config_.heartbeatInterval.count() <= 0 || config_.sweepInterval.count() <= 0) {
        throw std::invalid_argument("Heartbeat and sweep intervals must be positive");
    }
    // A single lost heartbeat must not flip a peer offline
    if (config_.stalenessThreshold <= config_.heartbeatInterval * 2) {
        throw std::invalid_argument("Staleness threshold (" + std::to_string(toSeconds(config_.stalenessThreshold)) +
                                    "s) must exceed twice the heartbeat interval (" +
                                    std::to_string(toSeconds(config_.heartbeatInterval)) + "s)");
    }
}

PresenceSyncEngine::~PresenceSyncEngine() {
    lifetime_.reset();
    if (subscription_ != ports::ISharedLocationStore::kInvalidSubscription) {
        store_->cancel(subscription_);
    }
}

void PresenceSyncEngine::start(const std::string& userId) {
    if (userId.empty() || userId.find_first_of("/+#") != std::string::npos) {
        throw std::invalid_argument("Invalid user id '" + userId + "'");
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    userId_ = userId;
    nextSweepAt_ = clock_->now() + config_.sweepInterval;
    std::cout << "[PresenceSync] Started for " << userId_ << " (heartbeat " << toSeconds(config_.heartbeatInterval)
              << "s, staleness " << toSeconds(config_.stalenessThreshold) << "s)" << std::endl;
}

void PresenceSyncEngine::stop() {
    unsubscribeAll();
    
    std::lock_guard<std::mutex> lock(mutex_);
    sharing_ = false;
    lastSample_.reset();
}

void PresenceSyncEngine::beginSharing() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (userId_.empty()) {
        std::cerr << "[PresenceSync] beginSharing before start()" << std::endl;
        return;
    }
    sharing_ = true;
}

TrackingResult PresenceSyncEngine::publish(const std::optional<LocationSample>& sample, bool sharingEnabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (userId_.empty()) {
        return TrackingResult::failure(TrackingError::InvalidArgument, "Presence engine not started");
    }
    
    auto now = clock_->now();
    if (!sharingEnabled) {
        sharing_ = false;
        lastSample_.reset();
        std::cout << "[PresenceSync] Sharing disabled, clearing published location" << std::endl;
        return writeLocked(buildRecordLocked(now), now);
    }
    
    if (!sharing_) {
        return TrackingResult::failure(TrackingError::PublishFailure, "Sharing is disabled, sample rejected");
    }
    
    if (sample) {
        lastSample_ = *sample;
    }
    return writeLocked(buildRecordLocked(now), now);
}

TrackingResult PresenceSyncEngine::sendHeartbeat() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (userId_.empty()) {
        return TrackingResult::failure(TrackingError::InvalidArgument, "Presence engine not started");
    }
    if (!sharing_) {
        return TrackingResult::failure(TrackingError::PublishFailure, "Sharing is disabled");
    }
    if (degraded_) {
        return TrackingResult::failure(TrackingError::AllStrategiesExhausted,
                                       "Heartbeat suppressed while tracking is degraded");
    }
    
    auto now = clock_->now();
    return writeLocked(buildRecordLocked(now), now);
}

TrackingResult PresenceSyncEngine::withdraw() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (userId_.empty()) {
        return TrackingResult::failure(TrackingError::InvalidArgument, "Presence engine not started");
    }
    
    sharing_ = false;
    lastSample_.reset();
    std::cout << "[PresenceSync] Withdrawing " << presenceKey(userId_) << std::endl;
    return writeLocked(std::nullopt, clock_->now());
}

TrackingResult PresenceSyncEngine::subscribeAll(PeerViewHandler handler) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (userId_.empty()) {
            return TrackingResult::failure(TrackingError::InvalidArgument, "Presence engine not started");
        }
        peerHandler_ = std::move(handler);
        if (subscription_ != ports::ISharedLocationStore::kInvalidSubscription) {
            return TrackingResult::success();
        }
    }
    
    std::weak_ptr<int> alive = lifetime_;
    auto id = store_->onValueChanged(kPresencePattern,
        [this, alive](const std::string& key, const std::optional<std::string>& value) {
            if (alive.expired()) return;
            onStoreValue(key, value);
        });
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (id == ports::ISharedLocationStore::kInvalidSubscription) {
        std::cerr << "[PresenceSync] Subscription to " << kPresencePattern << " failed" << std::endl;
        return TrackingResult::failure(TrackingError::PublishFailure, "Store subscription failed");
    }
    subscription_ = id;
    std::cout << "[PresenceSync] Subscribed to " << kPresencePattern << std::endl;
    return TrackingResult::success();
}

void PresenceSyncEngine::unsubscribeAll() {
    ports::ISharedLocationStore::SubscriptionId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = subscription_;
        subscription_ = ports::ISharedLocationStore::kInvalidSubscription;
        records_.clear();
        views_ = std::make_shared<const PeerMap>();
    }
    if (id != ports::ISharedLocationStore::kInvalidSubscription) {
        store_->cancel(id);
    }
}

void PresenceSyncEngine::sweep() {
    Changes changes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sweepLocked(clock_->now(), changes);
    }
    notify(changes);
}

void PresenceSyncEngine::tick() {
    Changes changes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (userId_.empty()) return;
        
        auto now = clock_->now();
        retryPendingLocked(now);
        
        if (sharing_ && !degraded_ && now - lastHeartbeatAt_ >= config_.heartbeatInterval) {
            auto result = writeLocked(buildRecordLocked(now), now);
            if (!result.ok()) {
                std::cerr << "[PresenceSync] Heartbeat not delivered: " << result.message << std::endl;
            }
        }
        
        if (now >= nextSweepAt_) {
            sweepLocked(now, changes);
        }
    }
    notify(changes);
}

void PresenceSyncEngine::setTrackingDegraded(bool degraded) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (degraded == degraded_) return;
    degraded_ = degraded;
    
    std::cout << "[PresenceSync] Tracking " << (degraded ? "degraded, heartbeats suspended" : "recovered") << std::endl;
    if (!sharing_ || userId_.empty()) return;
    
    // One record carrying the new status, then heartbeats stop (or resume)
    auto now = clock_->now();
    auto result = writeLocked(buildRecordLocked(now), now);
    if (!result.ok()) {
        std::cerr << "[PresenceSync] Status update not delivered: " << result.message << std::endl;
    }
}

void PresenceSyncEngine::setPublishDeferred(bool deferred) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (deferred == deferred_) return;
    deferred_ = deferred;
    
    std::cout << "[PresenceSync] Publishing " << (deferred ? "deferred (no network)" : "resumed") << std::endl;
    if (!deferred_) {
        retryPendingLocked(clock_->now());
    }
}

PresenceSyncEngine::Snapshot PresenceSyncEngine::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return views_;
}

std::optional<PeerPresenceView> PresenceSyncEngine::peer(const std::string& userId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = views_->find(userId);
    if (it == views_->end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PresenceSyncEngine::isSharing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sharing_;
}

bool PresenceSyncEngine::isTrackingDegraded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return degraded_;
}

bool PresenceSyncEngine::hasPendingWrite() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.has_value();
}

std::optional<PublishedPresence> PresenceSyncEngine::lastPublished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastPublished_;
}

PublishedPresence PresenceSyncEngine::buildRecordLocked(Timestamp now) {
    // Epoch-based floor keeps revisions increasing across process restarts
    revision_ = std::max<uint64_t>(revision_ + 1, static_cast<uint64_t>(std::max<int64_t>(toEpochMs(now), 0)));
    
    PublishedPresence record;
    record.userId = userId_;
    record.isSharingEnabled = sharing_;
    if (sharing_) {
        record.lastSample = lastSample_;
    }
    record.lastHeartbeatAt = now;
    record.status = degraded_ ? PresenceStatus::Degraded : PresenceStatus::Ok;
    record.revision = revision_;
    
    lastHeartbeatAt_ = now;
    return record;
}

TrackingResult PresenceSyncEngine::writeLocked(std::optional<PublishedPresence> record, Timestamp now) {
    lastPublished_ = record;
    
    if (deferred_ || !store_->isConnected()) {
        if (!pending_) {
            std::cout << "[PresenceSync] Store unavailable, write deferred" << std::endl;
        }
        pending_ = PendingWrite{std::move(record), 0, now};
        return TrackingResult::success();
    }
    
    if (putLocked(record)) {
        pending_.reset();
        return TrackingResult::success();
    }
    
    auto delay = policyEngine_->getPublishRetryPolicy().getBackoffDelay(1);
    std::cerr << "[PresenceSync] Write to " << presenceKey(userId_) << " failed, retrying in "
              << delay.count() << "ms" << std::endl;
    pending_ = PendingWrite{std::move(record), 1, now + delay};
    return TrackingResult::failure(TrackingError::PublishFailure, "Store rejected write to " + presenceKey(userId_));
}

bool PresenceSyncEngine::putLocked(const std::optional<PublishedPresence>& record) {
    auto key = presenceKey(userId_);
    if (!record) {
        return store_->remove(key);
    }
    return store_->put(key, JsonCodec::serialize(*record));
}

void PresenceSyncEngine::retryPendingLocked(Timestamp now) {
    if (!pending_ || deferred_ || !store_->isConnected() || now < pending_->nextAttemptAt) return;
    
    const auto& policy = policyEngine_->getPublishRetryPolicy();
    if (pending_->attempts > 0 && !policy.shouldRetry(pending_->attempts)) {
        std::cerr << "[PresenceSync] Dropping write after " << pending_->attempts << " attempts" << std::endl;
        pending_.reset();
        return;
    }
    
    // The record goes out now, so it carries the current time as its heartbeat
    if (pending_->record) {
        revision_ = std::max<uint64_t>(revision_ + 1, static_cast<uint64_t>(std::max<int64_t>(toEpochMs(now), 0)));
        pending_->record->lastHeartbeatAt = now;
        pending_->record->revision = revision_;
        lastHeartbeatAt_ = now;
        lastPublished_ = pending_->record;
    }
    
    if (putLocked(pending_->record)) {
        std::cout << "[PresenceSync] Pending write delivered" << std::endl;
        pending_.reset();
        return;
    }
    
    pending_->attempts++;
    pending_->nextAttemptAt = now + policy.getBackoffDelay(pending_->attempts);
}

void PresenceSyncEngine::onStoreValue(const std::string& key, const std::optional<std::string>& value) {
    Changes changes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (subscription_ == ports::ISharedLocationStore::kInvalidSubscription) return;
        
        auto peerId = userIdFromPresenceKey(key);
        if (peerId.empty() || peerId == userId_) return;
        
        auto now = clock_->now();
        if (!value || value->empty()) {
            records_.erase(peerId);
            eraseViewLocked(peerId, changes);
        } else {
            std::string error;
            auto record = JsonCodec::tryDeserialize(peerId, *value, &error);
            if (!record) {
                std::cerr << "[PresenceSync] Discarding malformed record for " << peerId << ": " << error << std::endl;
                return;
            }
            
            auto it = records_.find(peerId);
            if (it != records_.end() && record->revision < it->second.revision) {
                std::cout << "[PresenceSync] Ignoring stale record for " << peerId
                          << " (rev " << record->revision << " < " << it->second.revision << ")" << std::endl;
                return;
            }
            
            if (record->lastHeartbeatAt > now) {
                record->lastHeartbeatAt = now;
            }
            
            records_[peerId] = *record;
            applyViewLocked(deriveViewLocked(*record, now), changes);
        }
    }
    notify(changes);
}

PeerPresenceView PresenceSyncEngine::deriveViewLocked(const PublishedPresence& record, Timestamp now) const {
    PeerPresenceView view;
    view.userId = record.userId;
    view.isSharingEnabled = record.isSharingEnabled;
    view.trackingDegraded = record.status == PresenceStatus::Degraded;
    view.lastSeenAt = record.lastHeartbeatAt;
    view.isOnline = record.isSharingEnabled && (now - record.lastHeartbeatAt) < config_.stalenessThreshold;
    if (view.isOnline) {
        view.location = record.lastSample;
    }
    return view;
}

void PresenceSyncEngine::applyViewLocked(const PeerPresenceView& view, Changes& changes) {
    auto it = views_->find(view.userId);
    if (it != views_->end() && it->second == view) return;
    
    auto next = std::make_shared<PeerMap>(*views_);
    (*next)[view.userId] = view;
    views_ = std::move(next);
    changes.push_back(view);
}

void PresenceSyncEngine::eraseViewLocked(const std::string& userId, Changes& changes) {
    auto it = views_->find(userId);
    if (it == views_->end()) return;
    
    PeerPresenceView gone = it->second;
    gone.isOnline = false;
    gone.isSharingEnabled = false;
    gone.location.reset();
    
    auto next = std::make_shared<PeerMap>(*views_);
    next->erase(userId);
    views_ = std::move(next);
    changes.push_back(gone);
}

void PresenceSyncEngine::sweepLocked(Timestamp now, Changes& changes) {
    nextSweepAt_ = now + config_.sweepInterval;
    
    std::shared_ptr<PeerMap> next;
    for (const auto& [peerId, record] : records_) {
        auto view = deriveViewLocked(record, now);
        auto it = views_->find(peerId);
        if (it != views_->end() && it->second == view) continue;
        
        if (!next) {
            next = std::make_shared<PeerMap>(*views_);
        }
        if (it != views_->end() && it->second.isOnline && !view.isOnline) {
            std::cout << "[PresenceSync] " << peerId << " went offline" << std::endl;
        }
        (*next)[peerId] = view;
        changes.push_back(view);
    }
    
    if (next) {
        views_ = std::move(next);
    }
}

void PresenceSyncEngine::notify(const Changes& changes) {
    if (changes.empty()) return;
    
    PeerViewHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = peerHandler_;
    }
    if (!handler) return;
    
    for (const auto& view : changes) {
        handler(view);
    }
}

} // namespace geoshare::domain
