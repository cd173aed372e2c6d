#pragma once

#include "../IClock.hpp"
#include "../Presence.hpp"
#include "../Sampling.hpp"
#include "../TrackingError.hpp"
#include "../ports/IDispatcher.hpp"
#include "../ports/ILocationPermissions.hpp"
#include "../ports/ILocationSampler.hpp"
#include "../ports/IPolicyEngine.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace geoshare::domain {

enum class StrategyMode {
    Polling,        ///< One getCurrentPosition per cycle
    Subscription    ///< Platform update stream
};

/// One entry of the ordered strategy list, most capable first.
struct TrackingStrategy {
    std::string name;
    std::shared_ptr<ports::ILocationSampler> sampler;
    StrategyMode mode = StrategyMode::Subscription;
    ports::PermissionLevel requiredPermission = ports::PermissionLevel::Foreground;
};

struct TrackingSession {
    std::string userId;
    Timestamp startedAt{};
    std::string activeStrategy;
    bool isActive = false;
};

struct StrategySelectorConfig {
    std::chrono::milliseconds startupTimeout{std::chrono::seconds(15)};
    std::chrono::milliseconds healthCheckInterval{std::chrono::seconds(60)};
    std::chrono::milliseconds failedStrategyBackoff{std::chrono::minutes(5)};
    int maxConsecutiveTimeouts = 3;
};

/**
 * @brief Failover coordinator for the ordered list of tracking strategies.
 *
 * Idle -> Starting(i) -> Running(i) -> Recovering -> Starting(i+1) ... -> Stopped.
 *
 * A strategy counts as started only once it has delivered a sample within the
 * startup timeout; one that fails to start is skipped for the rest of the session.
 * A running strategy that stays silent for twice its cadence, reports the provider
 * unavailable, or times out maxConsecutiveTimeouts cycles in a row is torn down and
 * skipped for failedStrategyBackoff. With nothing left to try the coordinator goes
 * Degraded and retries the whole list after a capped exponential backoff.
 *
 * Sampler callbacks are marshalled onto the dispatcher; timers are evaluated by tick().
 * stop() may be called from any thread. Handlers are never invoked with the
 * internal lock held.
 */
class StrategySelector {
public:
    using SampleHandler = std::function<void(const LocationSample&)>;
    using StatusHandler = std::function<void(const TrackingStatusEvent&)>;

    StrategySelector(std::vector<TrackingStrategy> strategies,
                     std::shared_ptr<ports::IDispatcher> dispatcher,
                     std::shared_ptr<ports::ILocationPermissions> permissions,
                     std::shared_ptr<ports::IPolicyEngine> policyEngine,
                     std::shared_ptr<IClock> clock,
                     StrategySelectorConfig config = {});
    ~StrategySelector();
    
    StrategySelector(const StrategySelector&) = delete;
    StrategySelector& operator=(const StrategySelector&) = delete;

    void setSampleHandler(SampleHandler handler);
    void setStatusHandler(StatusHandler handler);

    /// Fails fast on missing consent or an empty user id. Success means Starting;
    /// the outcome (Running or a failure reason) arrives through the status handler.
    TrackingResult start(const std::string& userId, const SamplingParameters& params);
    void stop();
    
    /// Periodic liveness check of the active strategy. Also invoked by tick() on its own cadence.
    void onStrategyHealthCheck();
    
    void tick();
    
    /// Pushes new sampling parameters into the active strategy.
    void reconfigure(const SamplingParameters& params);

    TrackingState state() const;
    std::string activeStrategy() const;
    std::optional<TrackingSession> session() const;
    SamplingParameters parameters() const;
    bool isActive() const { return active_.load(); }

private:
    struct Entry {
        TrackingStrategy strategy;
        bool failedThisSession = false;
        std::optional<Timestamp> excludedUntil;
    };
    
    /// Handler invocations collected under the lock and run after it is released.
    struct Outbox {
        std::vector<TrackingStatusEvent> statuses;
        std::vector<LocationSample> samples;
    };

    void deliverSample(uint64_t generation, uint64_t pollId, const LocationSample& sample);
    void deliverError(uint64_t generation, uint64_t pollId, const TrackingResult& error);

    void attemptNextLocked(Outbox& out, Timestamp now);
    bool activateLocked(size_t index, Outbox& out, Timestamp now);
    void issuePollLocked(Timestamp now);
    void teardownActiveLocked();
    void strategyFailedLocked(const std::string& reason, TrackingError error, Outbox& out, Timestamp now);
    void startupFailedLocked(const std::string& reason, Outbox& out, Timestamp now);
    void cycleTimedOutLocked(Outbox& out, Timestamp now);
    void healthCheckLocked(Outbox& out, Timestamp now);
    void enterDegradedLocked(Outbox& out, Timestamp now);
    void endSessionLocked(TrackingState finalState, TrackingError reason, const std::string& message,
                          Outbox& out, Timestamp now);
    void setStateLocked(TrackingState state, const std::string& strategy, TrackingError reason,
                        const std::string& message, Outbox& out, Timestamp now);
    
    bool isEligibleLocked(const Entry& entry, ports::PermissionLevel granted, Timestamp now) const;
    std::optional<size_t> firstEligibleLocked(ports::PermissionLevel granted, Timestamp now) const;
    ports::UpdateRequest updateRequestLocked() const;
    std::string activeNameLocked() const;
    std::chrono::milliseconds silenceAllowanceLocked() const;
    
    void flush(Outbox& out);

    std::vector<Entry> strategies_;
    std::shared_ptr<ports::IDispatcher> dispatcher_;
    std::shared_ptr<ports::ILocationPermissions> permissions_;
    std::shared_ptr<ports::IPolicyEngine> policyEngine_;
    std::shared_ptr<IClock> clock_;
    StrategySelectorConfig config_;
    
    SampleHandler sampleHandler_;
    StatusHandler statusHandler_;
    
    mutable std::mutex mutex_;
    std::atomic<bool> active_{false};
    std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);
    
    TrackingState state_ = TrackingState::Idle;
    std::optional<TrackingSession> session_;
    SamplingParameters params_;
    
    std::optional<size_t> activeIndex_;
    uint64_t generation_ = 0;
    
    // Timing of the active strategy
    Timestamp startupDeadline_{};
    Timestamp lastSampleAt_{};
    // Interval the next sample is due within; lags a shortened interval until it takes effect
    std::chrono::milliseconds expectedInterval_{};
    Timestamp nextHealthCheckAt_{};
    int consecutiveTimeouts_ = 0;
    
    // Polling mode
    uint64_t pollId_ = 0;
    bool pollInFlight_ = false;
    Timestamp pollDeadline_{};
    Timestamp nextPollAt_{};
    
    // Degraded mode
    int recoveryAttempts_ = 0;
    Timestamp nextRecoveryAt_{};
    
    /// Grace period on top of the request timeout before an unanswered poll counts as timed out.
    static constexpr std::chrono::milliseconds POLL_GRACE{std::chrono::seconds(5)};
};

} // namespace geoshare::domain
