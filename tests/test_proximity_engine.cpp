#include <gtest/gtest.h>
#include "../core/domain/ProximityEngine.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>

using namespace geoshare;
using namespace std::chrono_literals;

class ProximityEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        engine_ = std::make_unique<domain::ProximityEngine>("alice", clock_);
        engine_->setGeofenceHandler([this](const GeofenceEvent& event) {
            geofenceEvents_.push_back(event);
        });

        engine_->onOwnLocationChanged(sampleAt(home_));
    }

    LocationSample sampleAt(const GeoPoint& point) {
        LocationSample sample;
        sample.lat = point.lat;
        sample.lng = point.lng;
        sample.capturedAt = clock_->now();
        return sample;
    }

    PeerPresenceView peerAt(const std::string& userId, double metersNorth, bool online = true) {
        PeerPresenceView view;
        view.userId = userId;
        view.isOnline = online;
        view.isSharingEnabled = true;
        view.lastSeenAt = clock_->now();
        if (online) {
            view.location = sampleAt(Geo::movePoint(home_, 0.0, metersNorth));
        }
        return view;
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::unique_ptr<domain::ProximityEngine> engine_;
    std::vector<GeofenceEvent> geofenceEvents_;
    GeoPoint home_{-26.2041, 28.0473};
};

TEST_F(ProximityEngineTest, NearbyPeerNotifiesOnce) {
    auto events = engine_->onPeerLocationsChanged({peerAt("bob", 200.0)});
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].peerId, "bob");
    EXPECT_NEAR(events[0].distanceMeters, 200.0, 1.0);
    EXPECT_EQ(events[0].at, clock_->now());

    clock_->advance(1min);
    EXPECT_TRUE(engine_->onPeerLocationsChanged({peerAt("bob", 150.0)}).empty());
}

TEST_F(ProximityEngineTest, FarPeerDoesNotNotify) {
    EXPECT_TRUE(engine_->onPeerLocationsChanged({peerAt("bob", 800.0)}).empty());
    EXPECT_FALSE(engine_->cooldown("bob").has_value());
}

TEST_F(ProximityEngineTest, NotifiesAgainAfterCooldownWhileStillNear) {
    ASSERT_EQ(engine_->onPeerLocationsChanged({peerAt("bob", 200.0)}).size(), 1u);

    clock_->advance(9min);
    EXPECT_TRUE(engine_->onPeerLocationsChanged({peerAt("bob", 200.0)}).empty());

    clock_->advance(1min);
    EXPECT_EQ(engine_->onPeerLocationsChanged({peerAt("bob", 200.0)}).size(), 1u);
}

TEST_F(ProximityEngineTest, MovingApartRearmsImmediately) {
    ASSERT_EQ(engine_->onPeerLocationsChanged({peerAt("bob", 200.0)}).size(), 1u);

    clock_->advance(1min);
    EXPECT_TRUE(engine_->onPeerLocationsChanged({peerAt("bob", 1500.0)}).empty());
    EXPECT_FALSE(engine_->cooldown("bob").has_value());

    clock_->advance(1min);
    EXPECT_EQ(engine_->onPeerLocationsChanged({peerAt("bob", 100.0)}).size(), 1u);
}

TEST_F(ProximityEngineTest, CooldownKeyedBySortedPair) {
    engine_->onPeerLocationsChanged({peerAt("bob", 100.0), peerAt("aaron", 100.0)});

    auto bob = engine_->cooldown("bob");
    ASSERT_TRUE(bob.has_value());
    EXPECT_EQ(bob->peerPairKey, "alice|bob");
    EXPECT_EQ(bob->lastNotifiedAt, clock_->now());

    auto aaron = engine_->cooldown("aaron");
    ASSERT_TRUE(aaron.has_value());
    EXPECT_EQ(aaron->peerPairKey, "aaron|alice");
}

TEST_F(ProximityEngineTest, OfflinePeerIsIgnored) {
    engine_->onPeerLocationsChanged({peerAt("bob", 100.0)});
    clock_->advance(20min);

    EXPECT_TRUE(engine_->onPeerLocationsChanged({peerAt("bob", 0.0, false)}).empty());
}

TEST_F(ProximityEngineTest, OwnMovementTriggersEvaluation) {
    engine_->onOwnLocationChanged(std::nullopt);
    EXPECT_TRUE(engine_->onPeerLocationsChanged({peerAt("bob", 2000.0)}).empty());

    int notified = 0;
    engine_->setProximityHandler([&](const ProximityEvent&) { ++notified; });

    engine_->onOwnLocationChanged(sampleAt(Geo::movePoint(home_, 0.0, 1800.0)));
    EXPECT_EQ(notified, 1);
}

TEST_F(ProximityEngineTest, OwnRecordIsIgnored) {
    EXPECT_TRUE(engine_->onPeerLocationsChanged({peerAt("alice", 0.0)}).empty());
}

TEST_F(ProximityEngineTest, GeofenceReportsTransitionsOnly) {
    GeofenceRegion office{"office", Geo::movePoint(home_, 0.0, 1000.0), 100.0, "Office"};
    ASSERT_TRUE(engine_->addGeofence(office));

    engine_->onPeerLocationsChanged({peerAt("bob", 0.0)});
    EXPECT_TRUE(geofenceEvents_.empty());

    engine_->onPeerLocationsChanged({peerAt("bob", 1020.0)});
    ASSERT_EQ(geofenceEvents_.size(), 1u);
    EXPECT_EQ(geofenceEvents_[0].regionId, "office");
    EXPECT_EQ(geofenceEvents_[0].label, "Office");
    EXPECT_EQ(geofenceEvents_[0].peerId, "bob");
    EXPECT_TRUE(geofenceEvents_[0].entered);
    EXPECT_TRUE(engine_->isInside("office", "bob"));

    engine_->onPeerLocationsChanged({peerAt("bob", 990.0)});
    EXPECT_EQ(geofenceEvents_.size(), 1u);

    engine_->onPeerLocationsChanged({peerAt("bob", 1500.0)});
    ASSERT_EQ(geofenceEvents_.size(), 2u);
    EXPECT_FALSE(geofenceEvents_[1].entered);
    EXPECT_FALSE(engine_->isInside("office", "bob"));
}

TEST_F(ProximityEngineTest, OfflinePeerDoesNotLeaveGeofence) {
    ASSERT_TRUE(engine_->addGeofence({"home", home_, 150.0, "Home"}));
    engine_->onPeerLocationsChanged({peerAt("bob", 10.0)});
    ASSERT_EQ(geofenceEvents_.size(), 1u);

    engine_->onPeerLocationsChanged({peerAt("bob", 0.0, false)});
    EXPECT_EQ(geofenceEvents_.size(), 1u);
    EXPECT_TRUE(engine_->isInside("home", "bob"));
}

TEST_F(ProximityEngineTest, GeofenceRegistration) {
    EXPECT_TRUE(engine_->addGeofence({"home", home_, 150.0, "Home"}));
    EXPECT_FALSE(engine_->addGeofence({"home", home_, 50.0, "Home again"}));
    EXPECT_FALSE(engine_->addGeofence({"bad", home_, 0.0, "Bad"}));
    EXPECT_EQ(engine_->geofences().size(), 1u);

    EXPECT_TRUE(engine_->removeGeofence("home"));
    EXPECT_FALSE(engine_->removeGeofence("home"));
    EXPECT_TRUE(engine_->geofences().empty());
}

TEST_F(ProximityEngineTest, ResetForgetsCooldownsButKeepsRegions) {
    ASSERT_TRUE(engine_->addGeofence({"home", home_, 150.0, "Home"}));
    engine_->onPeerLocationsChanged({peerAt("bob", 100.0)});
    ASSERT_TRUE(engine_->cooldown("bob").has_value());

    engine_->reset();
    EXPECT_FALSE(engine_->cooldown("bob").has_value());
    EXPECT_FALSE(engine_->isInside("home", "bob"));
    EXPECT_EQ(engine_->geofences().size(), 1u);
}

TEST(ProximityConfigTest, RejectsInvalidThreshold) {
    auto clock = std::make_shared<sim::SimulatedClock>();
    domain::ProximityConfig config;

    config.thresholdMeters = 0.0;
    EXPECT_THROW(domain::ProximityEngine("alice", clock, config), std::invalid_argument);

    config.thresholdMeters = 500.0;
    config.cooldown = -1s;
    EXPECT_THROW(domain::ProximityEngine("alice", clock, config), std::invalid_argument);
}
