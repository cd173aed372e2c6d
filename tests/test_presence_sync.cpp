#include <gtest/gtest.h>
#include "../core/domain/PresenceSyncEngine.hpp"
#include "../core/adapters/DefaultPolicies.hpp"
#include "../core/sim/MockLocationStore.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include "../core/JsonCodec.hpp"
#include <nlohmann/json.hpp>
#include <memory>

using namespace geoshare;
using namespace std::chrono_literals;

class PresenceSyncTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        store_ = std::make_shared<sim::MockLocationStore>();
        policyEngine_ = std::make_shared<adapters::DefaultPolicyEngine>();

        alice_ = std::make_unique<domain::PresenceSyncEngine>(store_, policyEngine_, clock_, config_);
        alice_->start("alice");
    }

    LocationSample sampleAt(double lat, double lng) {
        LocationSample sample;
        sample.lat = lat;
        sample.lng = lng;
        sample.accuracyMeters = 8.0;
        sample.capturedAt = clock_->now();
        sample.source = SourceProvider::Gps;
        return sample;
    }

    /// Peer record as another device would write it.
    std::string peerRecord(const std::string& userId, uint64_t revision, double lat, Timestamp heartbeat) {
        PublishedPresence record;
        record.userId = userId;
        record.isSharingEnabled = true;
        record.lastSample = sampleAt(lat, 28.0473);
        record.lastHeartbeatAt = heartbeat;
        record.revision = revision;
        return JsonCodec::serialize(record);
    }

    void followPeers() {
        ASSERT_TRUE(alice_->subscribeAll([this](const PeerPresenceView& view) {
            views_.push_back(view);
        }).ok());
    }

    nlohmann::json lastWriteFor(const std::string& key) {
        auto value = store_->value(key);
        EXPECT_TRUE(value.has_value());
        return value ? nlohmann::json::parse(*value) : nlohmann::json();
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<sim::MockLocationStore> store_;
    std::shared_ptr<adapters::DefaultPolicyEngine> policyEngine_;
    domain::PresenceConfig config_;
    std::unique_ptr<domain::PresenceSyncEngine> alice_;
    std::vector<PeerPresenceView> views_;
};

TEST_F(PresenceSyncTest, PublishWritesWholeRecord) {
    alice_->beginSharing();
    ASSERT_TRUE(alice_->publish(sampleAt(-26.2041, 28.0473), true).ok());

    auto json = lastWriteFor("presence/alice");
    EXPECT_TRUE(json["sharingEnabled"].get<bool>());
    EXPECT_DOUBLE_EQ(json["lat"].get<double>(), -26.2041);
    EXPECT_EQ(json["lastHeartbeatEpochMs"].get<int64_t>(), toEpochMs(clock_->now()));
    EXPECT_EQ(json["status"], "ok");
}

TEST_F(PresenceSyncTest, DisableClearsLocationInSameWrite) {
    alice_->beginSharing();
    ASSERT_TRUE(alice_->publish(sampleAt(-26.2041, 28.0473), true).ok());
    store_->clearWrites();

    ASSERT_TRUE(alice_->publish(std::nullopt, false).ok());

    auto writes = store_->writes();
    ASSERT_EQ(writes.size(), 1u);
    ASSERT_TRUE(writes[0].value.has_value());
    auto json = nlohmann::json::parse(*writes[0].value);
    EXPECT_FALSE(json["sharingEnabled"].get<bool>());
    EXPECT_FALSE(json.contains("lat"));
    EXPECT_FALSE(json.contains("lng"));
}

TEST_F(PresenceSyncTest, SamplesRejectedOnceSharingIsOff) {
    alice_->beginSharing();
    ASSERT_TRUE(alice_->publish(std::nullopt, false).ok());
    store_->clearWrites();

    auto result = alice_->publish(sampleAt(-26.2041, 28.0473), true);
    EXPECT_EQ(result.error, TrackingError::PublishFailure);
    EXPECT_TRUE(store_->writes().empty());

    // Heartbeats stop too
    clock_->advance(config_.heartbeatInterval * 2);
    alice_->tick();
    EXPECT_TRUE(store_->writes().empty());
}

TEST_F(PresenceSyncTest, HeartbeatsFollowConfiguredCadence) {
    alice_->beginSharing();
    ASSERT_TRUE(alice_->publish(sampleAt(-26.2041, 28.0473), true).ok());
    store_->clearWrites();

    clock_->advance(config_.heartbeatInterval - 1s);
    alice_->tick();
    EXPECT_TRUE(store_->writes().empty());

    clock_->advance(1s);
    alice_->tick();
    ASSERT_EQ(store_->writes().size(), 1u);

    // Heartbeat keeps the last sample
    auto json = lastWriteFor("presence/alice");
    EXPECT_TRUE(json.contains("lat"));
    EXPECT_EQ(json["lastHeartbeatEpochMs"].get<int64_t>(), toEpochMs(clock_->now()));
}

TEST_F(PresenceSyncTest, RevisionsIncreaseWithEveryWrite) {
    alice_->beginSharing();
    ASSERT_TRUE(alice_->publish(sampleAt(-26.2041, 28.0473), true).ok());
    auto first = alice_->lastPublished()->revision;

    // Same millisecond, still strictly greater
    ASSERT_TRUE(alice_->sendHeartbeat().ok());
    auto second = alice_->lastPublished()->revision;
    EXPECT_GT(second, first);
    EXPECT_GE(first, static_cast<uint64_t>(toEpochMs(clock_->now())));
}

TEST_F(PresenceSyncTest, PeerOnlineUntilStaleThenOfflineWithoutLocation) {
    followPeers();
    auto lastHeartbeat = clock_->now();
    store_->injectValue("presence/bob", peerRecord("bob", 1, -26.2000, lastHeartbeat));
    store_->processEvents();

    auto bob = alice_->peer("bob");
    ASSERT_TRUE(bob.has_value());
    EXPECT_TRUE(bob->isOnline);
    ASSERT_TRUE(bob->location.has_value());
    EXPECT_DOUBLE_EQ(bob->location->lat, -26.2000);

    // Offline no later than staleness plus one sweep interval
    while (clock_->now() - lastHeartbeat < config_.stalenessThreshold + config_.sweepInterval) {
        clock_->advance(1s);
        alice_->tick();
    }

    bob = alice_->peer("bob");
    ASSERT_TRUE(bob.has_value());
    EXPECT_FALSE(bob->isOnline);
    EXPECT_FALSE(bob->location.has_value());
    EXPECT_EQ(bob->lastSeenAt, lastHeartbeat);
    EXPECT_FALSE(views_.back().isOnline);
}

TEST_F(PresenceSyncTest, StaleRevisionDoesNotOverwriteNewer) {
    followPeers();
    store_->setReverseDelivery(true);

    store_->injectValue("presence/bob", peerRecord("bob", 100, -26.1000, clock_->now()));
    store_->injectValue("presence/bob", peerRecord("bob", 200, -26.2000, clock_->now()));
    store_->processEvents();

    auto bob = alice_->peer("bob");
    ASSERT_TRUE(bob.has_value());
    ASSERT_TRUE(bob->location.has_value());
    EXPECT_DOUBLE_EQ(bob->location->lat, -26.2000);
}

TEST_F(PresenceSyncTest, FutureHeartbeatIsClampedToLocalTime) {
    followPeers();
    store_->injectValue("presence/bob", peerRecord("bob", 1, -26.2000, clock_->now() + 1h));
    store_->processEvents();

    auto bob = alice_->peer("bob");
    ASSERT_TRUE(bob.has_value());
    EXPECT_EQ(bob->lastSeenAt, clock_->now());

    // A skewed clock cannot keep a peer online forever
    clock_->advance(config_.stalenessThreshold + 1s);
    alice_->sweep();
    EXPECT_FALSE(alice_->peer("bob")->isOnline);
}

TEST_F(PresenceSyncTest, MalformedPayloadKeepsLastGoodView) {
    followPeers();
    store_->injectValue("presence/bob", peerRecord("bob", 1, -26.2000, clock_->now()));
    store_->processEvents();
    auto good = alice_->peer("bob");
    ASSERT_TRUE(good.has_value());

    store_->injectValue("presence/bob", "{not json");
    store_->injectValue("presence/bob", R"({"sharingEnabled":true,"lastHeartbeatEpochMs":1,"lat":1.0})");
    store_->injectValue("presence/bob", R"({"sharingEnabled":"yes","lastHeartbeatEpochMs":1})");
    EXPECT_NO_THROW(store_->processEvents());

    EXPECT_EQ(alice_->peer("bob"), good);
}

TEST_F(PresenceSyncTest, NegativeRevisionCannotPinPeerRecord) {
    followPeers();
    store_->injectValue("presence/bob", peerRecord("bob", 1, -26.2000, clock_->now()));
    store_->processEvents();

    auto record = nlohmann::json::parse(peerRecord("bob", 1, -26.3000, clock_->now()));
    record["rev"] = -1;
    store_->injectValue("presence/bob", record.dump());
    store_->processEvents();
    ASSERT_TRUE(alice_->peer("bob")->location.has_value());
    EXPECT_DOUBLE_EQ(alice_->peer("bob")->location->lat, -26.2000);

    store_->injectValue("presence/bob", peerRecord("bob", 2, -26.4000, clock_->now()));
    store_->processEvents();
    ASSERT_TRUE(alice_->peer("bob")->location.has_value());
    EXPECT_DOUBLE_EQ(alice_->peer("bob")->location->lat, -26.4000);
}

TEST_F(PresenceSyncTest, OwnRecordAndForeignKeysAreIgnored) {
    followPeers();
    alice_->beginSharing();
    ASSERT_TRUE(alice_->publish(sampleAt(-26.2041, 28.0473), true).ok());
    store_->injectValue("presence/carol/extra", peerRecord("carol", 1, -26.2, clock_->now()));
    store_->processEvents();

    EXPECT_TRUE(alice_->snapshot()->empty());
    EXPECT_TRUE(views_.empty());
}

TEST_F(PresenceSyncTest, RemovedPeerIsReportedOffline) {
    followPeers();
    store_->injectValue("presence/bob", peerRecord("bob", 1, -26.2000, clock_->now()));
    store_->processEvents();
    ASSERT_TRUE(alice_->peer("bob").has_value());

    ASSERT_TRUE(store_->remove("presence/bob"));
    store_->processEvents();

    EXPECT_FALSE(alice_->peer("bob").has_value());
    ASSERT_FALSE(views_.empty());
    EXPECT_EQ(views_.back().userId, "bob");
    EXPECT_FALSE(views_.back().isOnline);
    EXPECT_FALSE(views_.back().location.has_value());
}

TEST_F(PresenceSyncTest, SnapshotIsImmutableCopy) {
    followPeers();
    store_->injectValue("presence/bob", peerRecord("bob", 1, -26.2000, clock_->now()));
    store_->processEvents();
    auto before = alice_->snapshot();

    store_->injectValue("presence/carol", peerRecord("carol", 1, -26.1000, clock_->now()));
    store_->processEvents();

    EXPECT_EQ(before->size(), 1u);
    EXPECT_EQ(alice_->snapshot()->size(), 2u);
}

TEST_F(PresenceSyncTest, FailedWriteIsRetriedWithRefreshedHeartbeat) {
    alice_->beginSharing();
    store_->failNextPublishes(1);

    auto result = alice_->publish(sampleAt(-26.2041, 28.0473), true);
    EXPECT_EQ(result.error, TrackingError::PublishFailure);
    EXPECT_TRUE(alice_->hasPendingWrite());

    clock_->advance(1s);
    alice_->tick();

    EXPECT_FALSE(alice_->hasPendingWrite());
    auto json = lastWriteFor("presence/alice");
    EXPECT_EQ(json["lastHeartbeatEpochMs"].get<int64_t>(), toEpochMs(clock_->now()));
}

TEST_F(PresenceSyncTest, FailedWriteIsDroppedAfterBoundedRetries) {
    alice_->beginSharing();
    store_->setFailPublish(true);

    EXPECT_FALSE(alice_->publish(sampleAt(-26.2041, 28.0473), true).ok());

    // Retries at +1s, +3s, +7s, +15s, then the write is abandoned
    for (int i = 0; i < 32; ++i) {
        clock_->advance(1s);
        alice_->tick();
    }
    EXPECT_FALSE(alice_->hasPendingWrite());

    // The next sample goes out on its own, nothing is replayed
    store_->setFailPublish(false);
    ASSERT_TRUE(alice_->publish(sampleAt(-26.3000, 28.0473), true).ok());
    ASSERT_EQ(store_->writes().size(), 1u);
    EXPECT_DOUBLE_EQ(lastWriteFor("presence/alice")["lat"].get<double>(), -26.3000);
}

TEST_F(PresenceSyncTest, NewerWriteSupersedesPendingOne) {
    alice_->beginSharing();
    store_->failNextPublishes(1);
    EXPECT_FALSE(alice_->publish(sampleAt(-26.1000, 28.0473), true).ok());

    ASSERT_TRUE(alice_->publish(sampleAt(-26.2000, 28.0473), true).ok());
    EXPECT_FALSE(alice_->hasPendingWrite());

    clock_->advance(5s);
    alice_->tick();
    ASSERT_EQ(store_->writes().size(), 1u);
    EXPECT_DOUBLE_EQ(lastWriteFor("presence/alice")["lat"].get<double>(), -26.2000);
}

TEST_F(PresenceSyncTest, DeferredWriteFlushesWhenNetworkReturns) {
    alice_->beginSharing();
    alice_->setPublishDeferred(true);

    EXPECT_TRUE(alice_->publish(sampleAt(-26.1000, 28.0473), true).ok());
    EXPECT_TRUE(alice_->publish(sampleAt(-26.2000, 28.0473), true).ok());
    EXPECT_TRUE(store_->writes().empty());
    EXPECT_TRUE(alice_->hasPendingWrite());

    clock_->advance(10s);
    alice_->setPublishDeferred(false);

    ASSERT_EQ(store_->writes().size(), 1u);
    auto json = lastWriteFor("presence/alice");
    EXPECT_DOUBLE_EQ(json["lat"].get<double>(), -26.2000);
    EXPECT_EQ(json["lastHeartbeatEpochMs"].get<int64_t>(), toEpochMs(clock_->now()));
}

TEST_F(PresenceSyncTest, DisconnectedStoreHoldsWriteUntilReconnect) {
    alice_->beginSharing();
    store_->simulateConnectionLoss();

    EXPECT_TRUE(alice_->publish(sampleAt(-26.2000, 28.0473), true).ok());
    EXPECT_TRUE(alice_->hasPendingWrite());

    store_->simulateConnectionRestore();
    clock_->advance(1s);
    alice_->tick();

    EXPECT_FALSE(alice_->hasPendingWrite());
    EXPECT_TRUE(store_->value("presence/alice").has_value());
}

TEST_F(PresenceSyncTest, DegradedPublishesStatusOnceAndSuspendsHeartbeats) {
    alice_->beginSharing();
    ASSERT_TRUE(alice_->publish(sampleAt(-26.2041, 28.0473), true).ok());
    store_->clearWrites();

    alice_->setTrackingDegraded(true);
    ASSERT_EQ(store_->writes().size(), 1u);
    EXPECT_EQ(lastWriteFor("presence/alice")["status"], "degraded");

    for (int i = 0; i < 5; ++i) {
        clock_->advance(config_.heartbeatInterval);
        alice_->tick();
    }
    EXPECT_EQ(store_->writes().size(), 1u);
    EXPECT_EQ(alice_->sendHeartbeat().error, TrackingError::AllStrategiesExhausted);

    alice_->setTrackingDegraded(false);
    EXPECT_EQ(store_->writes().size(), 2u);
    EXPECT_EQ(lastWriteFor("presence/alice")["status"], "ok");
}

TEST_F(PresenceSyncTest, DegradedPeerGoesOfflineAfterStaleness) {
    domain::PresenceSyncEngine bob(store_, policyEngine_, clock_, config_);
    bob.start("bob");
    bob.beginSharing();
    ASSERT_TRUE(bob.publish(sampleAt(-26.2000, 28.0473), true).ok());
    bob.setTrackingDegraded(true);

    followPeers();
    store_->processEvents();
    auto view = alice_->peer("bob");
    ASSERT_TRUE(view.has_value());
    EXPECT_TRUE(view->isOnline);
    EXPECT_TRUE(view->trackingDegraded);

    for (int i = 0; i < 150; ++i) {
        clock_->advance(1s);
        bob.tick();
        store_->processEvents();
        alice_->tick();
    }

    view = alice_->peer("bob");
    ASSERT_TRUE(view.has_value());
    EXPECT_FALSE(view->isOnline);
    EXPECT_EQ(lastSeenText(*view, clock_->now()), "Location 2 min ago");
}

TEST_F(PresenceSyncTest, WithdrawRemovesRecord) {
    alice_->beginSharing();
    ASSERT_TRUE(alice_->publish(sampleAt(-26.2041, 28.0473), true).ok());

    ASSERT_TRUE(alice_->withdraw().ok());
    EXPECT_FALSE(store_->value("presence/alice").has_value());
    EXPECT_FALSE(alice_->isSharing());
}

TEST_F(PresenceSyncTest, InvalidUserIdIsRejected) {
    domain::PresenceSyncEngine engine(store_, policyEngine_, clock_, config_);
    EXPECT_THROW(engine.start(""), std::invalid_argument);
    EXPECT_THROW(engine.start("a/b"), std::invalid_argument);
    EXPECT_THROW(engine.start("a+"), std::invalid_argument);
    EXPECT_NO_THROW(engine.start("bob"));
}

TEST(PresenceConfigTest, StalenessMustExceedTwiceHeartbeat) {
    auto clock = std::make_shared<sim::SimulatedClock>();
    auto store = std::make_shared<sim::MockLocationStore>();
    auto policyEngine = std::make_shared<adapters::DefaultPolicyEngine>();

    domain::PresenceConfig config;
    config.heartbeatInterval = 30s;
    config.stalenessThreshold = 60s;
    EXPECT_THROW(domain::PresenceSyncEngine(store, policyEngine, clock, config), std::invalid_argument);

    config.stalenessThreshold = 61s;
    EXPECT_NO_THROW(domain::PresenceSyncEngine(store, policyEngine, clock, config));

    config.sweepInterval = 0s;
    EXPECT_THROW(domain::PresenceSyncEngine(store, policyEngine, clock, config), std::invalid_argument);
}
