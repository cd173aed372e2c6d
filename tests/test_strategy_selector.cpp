#include <gtest/gtest.h>
#include "../core/domain/StrategySelector.hpp"
#include "../core/domain/TaskQueue.hpp"
#include "../core/adapters/DefaultPolicies.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include "../core/sim/SimulatedLocationSampler.hpp"
#include "../core/sim/SimulatedPlatform.hpp"
#include <algorithm>
#include <memory>

using namespace geoshare;
using namespace std::chrono_literals;

class StrategySelectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        queue_ = std::make_shared<domain::TaskQueue>();
        permissions_ = std::make_shared<sim::StaticLocationPermissions>();
        policyEngine_ = std::make_shared<adapters::DefaultPolicyEngine>();

        samplerA_ = std::make_shared<sim::SimulatedLocationSampler>("a", clock_);
        samplerB_ = std::make_shared<sim::SimulatedLocationSampler>("b", clock_);
        samplerA_->setPosition({-26.2041, 28.0473});
        samplerB_->setPosition({-26.2041, 28.0473});
    }

    void createSelector(domain::StrategyMode modeA = domain::StrategyMode::Subscription,
                        domain::StrategyMode modeB = domain::StrategyMode::Subscription) {
        std::vector<domain::TrackingStrategy> strategies = {
            {"a", samplerA_, modeA, ports::PermissionLevel::Foreground},
            {"b", samplerB_, modeB, ports::PermissionLevel::Foreground},
        };
        selector_ = std::make_unique<domain::StrategySelector>(strategies, queue_, permissions_,
                                                               policyEngine_, clock_, config_);
        selector_->setStatusHandler([this](const TrackingStatusEvent& event) {
            statuses_.push_back(event);
        });
        selector_->setSampleHandler([this](const LocationSample& sample) {
            samples_.push_back(sample);
        });
    }

    /// One worker iteration: samplers emit, timers run, queued callbacks are delivered.
    void pump() {
        samplerA_->tick();
        samplerB_->tick();
        selector_->tick();
        queue_->drain();
    }

    void runFor(std::chrono::milliseconds duration, std::chrono::milliseconds step = 1s) {
        auto end = clock_->now() + duration;
        while (clock_->now() < end) {
            clock_->advance(step);
            pump();
        }
    }

    bool sawState(TrackingState state, const std::string& strategy = "") const {
        return std::any_of(statuses_.begin(), statuses_.end(), [&](const TrackingStatusEvent& e) {
            return e.state == state && (strategy.empty() || e.strategy == strategy);
        });
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<domain::TaskQueue> queue_;
    std::shared_ptr<sim::StaticLocationPermissions> permissions_;
    std::shared_ptr<adapters::DefaultPolicyEngine> policyEngine_;
    std::shared_ptr<sim::SimulatedLocationSampler> samplerA_;
    std::shared_ptr<sim::SimulatedLocationSampler> samplerB_;
    domain::StrategySelectorConfig config_;
    SamplingParameters params_;
    std::unique_ptr<domain::StrategySelector> selector_;

    std::vector<TrackingStatusEvent> statuses_;
    std::vector<LocationSample> samples_;
};

TEST_F(StrategySelectorTest, StartsFirstHealthyStrategy) {
    createSelector();

    ASSERT_TRUE(selector_->start("alice", params_).ok());
    EXPECT_EQ(selector_->state(), TrackingState::Starting);

    pump();
    EXPECT_EQ(selector_->state(), TrackingState::Running);
    EXPECT_EQ(selector_->activeStrategy(), "a");
    ASSERT_EQ(samples_.size(), 1u);

    auto session = selector_->session();
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->userId, "alice");
    EXPECT_EQ(session->activeStrategy, "a");
    EXPECT_TRUE(session->isActive);
}

TEST_F(StrategySelectorTest, FailedStrategyIsNotRetriedInSameSession) {
    samplerA_->setBehavior(sim::SamplerBehavior::FailToStart);
    createSelector();

    ASSERT_TRUE(selector_->start("alice", params_).ok());
    pump();

    EXPECT_EQ(selector_->state(), TrackingState::Running);
    EXPECT_EQ(selector_->activeStrategy(), "b");
    EXPECT_EQ(samplerA_->requestCount(), 1);

    // A recovers, but stays skipped until the session ends
    samplerA_->setBehavior(sim::SamplerBehavior::Healthy);
    runFor(10min, 5s);
    EXPECT_EQ(selector_->activeStrategy(), "b");
    EXPECT_EQ(samplerA_->requestCount(), 1);
}

TEST_F(StrategySelectorTest, SilentStrategyFailsOverWithinOneHealthCheck) {
    params_.sampleInterval = 20s;
    createSelector();

    ASSERT_TRUE(selector_->start("alice", params_).ok());
    pump();
    ASSERT_EQ(selector_->activeStrategy(), "a");
    auto runningSince = clock_->now();

    samplerA_->setBehavior(sim::SamplerBehavior::Silent);
    runFor(config_.healthCheckInterval + 5s, 5s);

    EXPECT_TRUE(sawState(TrackingState::Recovering, "a"));
    EXPECT_EQ(selector_->state(), TrackingState::Running);
    EXPECT_EQ(selector_->activeStrategy(), "b");
    EXPECT_FALSE(samplerA_->isSubscribed());
    EXPECT_LE(clock_->now() - runningSince, config_.healthCheckInterval + 5s);

    auto recovering = std::find_if(statuses_.begin(), statuses_.end(), [](const TrackingStatusEvent& e) {
        return e.state == TrackingState::Recovering;
    });
    auto runningB = std::find_if(statuses_.begin(), statuses_.end(), [](const TrackingStatusEvent& e) {
        return e.state == TrackingState::Running && e.strategy == "b";
    });
    EXPECT_LT(recovering, runningB);
}

TEST_F(StrategySelectorTest, ExplicitHealthCheckDetectsSilence) {
    createSelector();

    ASSERT_TRUE(selector_->start("alice", params_).ok());
    pump();

    samplerA_->setBehavior(sim::SamplerBehavior::Silent);
    clock_->advance(params_.sampleInterval * 2 + 1s);
    selector_->onStrategyHealthCheck();

    EXPECT_TRUE(sawState(TrackingState::Recovering, "a"));
    EXPECT_EQ(selector_->state(), TrackingState::Starting);
    EXPECT_EQ(selector_->activeStrategy(), "b");
}

TEST_F(StrategySelectorTest, ConsecutiveTimeoutsTriggerFailover) {
    config_.healthCheckInterval = 10min;
    createSelector(domain::StrategyMode::Polling, domain::StrategyMode::Polling);

    ASSERT_TRUE(selector_->start("alice", params_).ok());
    queue_->drain();
    ASSERT_EQ(selector_->state(), TrackingState::Running);

    samplerA_->setBehavior(sim::SamplerBehavior::Timeout);

    // Two timeouts are absorbed at normal cadence
    runFor(params_.sampleInterval * 2, 5s);
    EXPECT_EQ(selector_->activeStrategy(), "a");
    EXPECT_EQ(samplerA_->requestCount(), 3);

    runFor(params_.sampleInterval, 5s);
    EXPECT_EQ(samplerA_->requestCount(), 4);
    EXPECT_EQ(selector_->activeStrategy(), "b");
    EXPECT_EQ(selector_->state(), TrackingState::Running);

    auto recovering = std::find_if(statuses_.begin(), statuses_.end(), [](const TrackingStatusEvent& e) {
        return e.state == TrackingState::Recovering;
    });
    ASSERT_NE(recovering, statuses_.end());
    EXPECT_EQ(recovering->reason, TrackingError::SampleTimeout);
    EXPECT_EQ(recovering->strategy, "a");
}

TEST_F(StrategySelectorTest, StartupTimeoutMovesToNextStrategy) {
    samplerA_->setBehavior(sim::SamplerBehavior::Silent);
    createSelector();

    ASSERT_TRUE(selector_->start("alice", params_).ok());
    runFor(config_.startupTimeout - 1s);
    EXPECT_EQ(selector_->activeStrategy(), "a");
    EXPECT_EQ(selector_->state(), TrackingState::Starting);

    runFor(2s);
    EXPECT_EQ(selector_->activeStrategy(), "b");
    EXPECT_EQ(selector_->state(), TrackingState::Running);
}

TEST_F(StrategySelectorTest, PermissionDeniedFailsFast) {
    permissions_->setPermission(ports::PermissionLevel::Denied);
    createSelector();

    auto result = selector_->start("alice", params_);
    EXPECT_EQ(result.error, TrackingError::PermissionDenied);
    EXPECT_FALSE(selector_->isActive());
    EXPECT_EQ(selector_->state(), TrackingState::Idle);
    EXPECT_EQ(samplerA_->requestCount(), 0);
    EXPECT_EQ(samplerB_->requestCount(), 0);

    ASSERT_FALSE(statuses_.empty());
    EXPECT_EQ(statuses_.back().reason, TrackingError::PermissionDenied);
}

TEST_F(StrategySelectorTest, StrategiesNeedingBackgroundPermissionAreSkipped) {
    permissions_->setPermission(ports::PermissionLevel::Foreground);
    std::vector<domain::TrackingStrategy> strategies = {
        {"a", samplerA_, domain::StrategyMode::Subscription, ports::PermissionLevel::Background},
        {"b", samplerB_, domain::StrategyMode::Subscription, ports::PermissionLevel::Foreground},
    };
    domain::StrategySelector selector(strategies, queue_, permissions_, policyEngine_, clock_);

    ASSERT_TRUE(selector.start("alice", params_).ok());
    samplerB_->tick();
    queue_->drain();

    EXPECT_EQ(selector.activeStrategy(), "b");
    EXPECT_EQ(samplerA_->requestCount(), 0);
}

TEST_F(StrategySelectorTest, PermissionRevokedWhileRunningEndsSession) {
    createSelector();
    ASSERT_TRUE(selector_->start("alice", params_).ok());
    pump();

    samplerA_->setBehavior(sim::SamplerBehavior::PermissionDenied);
    runFor(params_.sampleInterval + 1s);

    EXPECT_FALSE(selector_->isActive());
    EXPECT_EQ(selector_->state(), TrackingState::Idle);
    EXPECT_EQ(statuses_.back().reason, TrackingError::PermissionDenied);
    EXPECT_EQ(samplerB_->requestCount(), 0);
}

TEST_F(StrategySelectorTest, PermissionDeniedOnSubscribeEndsSessionWithoutFailover) {
    samplerA_->setBehavior(sim::SamplerBehavior::PermissionDenied);
    createSelector();

    selector_->start("alice", params_);
    queue_->drain();

    EXPECT_FALSE(selector_->isActive());
    EXPECT_EQ(selector_->state(), TrackingState::Idle);
    ASSERT_FALSE(statuses_.empty());
    EXPECT_EQ(statuses_.back().reason, TrackingError::PermissionDenied);
    EXPECT_EQ(samplerB_->requestCount(), 0);
}

TEST_F(StrategySelectorTest, ExhaustionDegradesAndRetriesWithBackoff) {
    samplerA_->setBehavior(sim::SamplerBehavior::FailToStart);
    samplerB_->setBehavior(sim::SamplerBehavior::FailToStart);
    createSelector();

    ASSERT_TRUE(selector_->start("alice", params_).ok());
    EXPECT_EQ(selector_->state(), TrackingState::Degraded);
    EXPECT_TRUE(selector_->isActive());
    EXPECT_EQ(statuses_.back().reason, TrackingError::AllStrategiesExhausted);

    // No tight loop while waiting for the first recovery attempt
    runFor(29s);
    EXPECT_EQ(samplerA_->requestCount(), 1);
    EXPECT_EQ(samplerB_->requestCount(), 1);

    runFor(2s);
    EXPECT_EQ(samplerA_->requestCount(), 2);
    EXPECT_EQ(selector_->state(), TrackingState::Degraded);

    // Second attempt waits twice as long
    runFor(58s);
    EXPECT_EQ(samplerA_->requestCount(), 2);

    samplerB_->setBehavior(sim::SamplerBehavior::Healthy);
    runFor(3s);
    EXPECT_EQ(selector_->state(), TrackingState::Running);
    EXPECT_EQ(selector_->activeStrategy(), "b");
}

TEST_F(StrategySelectorTest, PromotesBackAfterBackoffWindow) {
    config_.failedStrategyBackoff = 2min;
    createSelector();

    ASSERT_TRUE(selector_->start("alice", params_).ok());
    pump();

    samplerA_->setBehavior(sim::SamplerBehavior::Silent);
    clock_->advance(params_.sampleInterval * 2 + 1s);
    selector_->onStrategyHealthCheck();
    pump();
    ASSERT_EQ(selector_->activeStrategy(), "b");

    samplerA_->setBehavior(sim::SamplerBehavior::Healthy);
    runFor(config_.failedStrategyBackoff + config_.healthCheckInterval + 5s, 5s);
    EXPECT_EQ(selector_->activeStrategy(), "a");
    EXPECT_EQ(selector_->state(), TrackingState::Running);
    EXPECT_FALSE(samplerB_->isSubscribed());
}

TEST_F(StrategySelectorTest, StopDropsSamplesAlreadyInFlight) {
    createSelector();
    ASSERT_TRUE(selector_->start("alice", params_).ok());
    pump();
    ASSERT_EQ(samples_.size(), 1u);

    clock_->advance(params_.sampleInterval);
    samplerA_->tick();
    ASSERT_EQ(queue_->size(), 1u);

    selector_->stop();
    queue_->drain();

    EXPECT_EQ(samples_.size(), 1u);
    EXPECT_EQ(selector_->state(), TrackingState::Stopped);
    EXPECT_FALSE(selector_->session().has_value());
    EXPECT_FALSE(samplerA_->isSubscribed());
}

TEST_F(StrategySelectorTest, StopIsSafeFromAnyState) {
    createSelector();

    selector_->stop();
    EXPECT_EQ(selector_->state(), TrackingState::Stopped);

    ASSERT_TRUE(selector_->start("alice", params_).ok());
    selector_->stop();
    selector_->stop();

    auto stops = std::count_if(statuses_.begin(), statuses_.end(), [](const TrackingStatusEvent& e) {
        return e.state == TrackingState::Stopped;
    });
    EXPECT_EQ(stops, 2);

    // A new session can start after stop
    EXPECT_TRUE(selector_->start("alice", params_).ok());
}

TEST_F(StrategySelectorTest, RejectsInvalidStart) {
    createSelector();

    EXPECT_EQ(selector_->start("", params_).error, TrackingError::InvalidArgument);
    ASSERT_TRUE(selector_->start("alice", params_).ok());
    EXPECT_EQ(selector_->start("alice", params_).error, TrackingError::InvalidArgument);
}

TEST_F(StrategySelectorTest, ReconfigureUpdatesActiveSubscription) {
    createSelector();
    ASSERT_TRUE(selector_->start("alice", params_).ok());
    pump();

    SamplingParameters slower = params_;
    slower.sampleInterval = 60s;
    slower.accuracy = AccuracyClass::Medium;
    selector_->reconfigure(slower);

    auto subscription = samplerA_->subscription();
    ASSERT_TRUE(subscription.has_value());
    EXPECT_EQ(subscription->interval, 60s);
    EXPECT_EQ(subscription->accuracy, AccuracyClass::Medium);
}

TEST_F(StrategySelectorTest, ShorterPollingIntervalDoesNotTripHealthCheckBeforeNextPoll) {
    params_.sampleInterval = 60s;
    createSelector(domain::StrategyMode::Polling, domain::StrategyMode::Polling);

    ASSERT_TRUE(selector_->start("alice", params_).ok());
    queue_->drain();
    ASSERT_EQ(selector_->state(), TrackingState::Running);

    runFor(50s);
    SamplingParameters faster = params_;
    faster.sampleInterval = 12s;
    selector_->reconfigure(faster);

    // The poll scheduled under the old interval lands together with the health check
    runFor(20s);
    EXPECT_FALSE(sawState(TrackingState::Recovering, "a"));
    EXPECT_EQ(selector_->activeStrategy(), "a");
    EXPECT_EQ(selector_->state(), TrackingState::Running);
    EXPECT_EQ(samplerA_->requestCount(), 2);
    EXPECT_EQ(samplerB_->requestCount(), 0);
}

TEST_F(StrategySelectorTest, SilenceIsMeasuredAgainstShorterIntervalOnceApplied) {
    params_.sampleInterval = 20s;
    config_.healthCheckInterval = 30s;
    createSelector();

    ASSERT_TRUE(selector_->start("alice", params_).ok());
    pump();

    SamplingParameters faster = params_;
    faster.sampleInterval = 5s;
    selector_->reconfigure(faster);
    runFor(10s);
    ASSERT_EQ(selector_->activeStrategy(), "a");

    samplerA_->setBehavior(sim::SamplerBehavior::Silent);
    runFor(config_.healthCheckInterval);

    EXPECT_TRUE(sawState(TrackingState::Recovering, "a"));
    EXPECT_EQ(selector_->activeStrategy(), "b");
}

TEST(StrategySelectorConstructionTest, RejectsMissingDependencies) {
    auto clock = std::make_shared<sim::SimulatedClock>();
    auto queue = std::make_shared<domain::TaskQueue>();
    auto permissions = std::make_shared<sim::StaticLocationPermissions>();
    auto policyEngine = std::make_shared<adapters::DefaultPolicyEngine>();

    EXPECT_THROW(domain::StrategySelector({}, nullptr, permissions, policyEngine, clock), std::invalid_argument);

    std::vector<domain::TrackingStrategy> noSampler = {{"a", nullptr}};
    EXPECT_THROW(domain::StrategySelector(noSampler, queue, permissions, policyEngine, clock), std::invalid_argument);
}
