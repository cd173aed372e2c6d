#include "StrategySelector.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace geoshare::domain {

StrategySelector::StrategySelector(std::vector<TrackingStrategy> strategies,
                                   std::shared_ptr<ports::IDispatcher> dispatcher,
                                   std::shared_ptr<ports::ILocationPermissions> permissions,
                                   std::shared_ptr<ports::IPolicyEngine> policyEngine,
                                   std::shared_ptr<IClock> clock,
                                   StrategySelectorConfig config)
    : dispatcher_(std::move(dispatcher)),
      permissions_(std::move(permissions)),
      policyEngine_(std::move(policyEngine)),
      clock_(std::move(clock)),
      config_(config) {
    if (!dispatcher_ || !permissions_ || !policyEngine_ || !clock_) {
        throw std::invalid_argument("StrategySelector requires dispatcher, permissions, policy engine and clock");
    }
    if (config_.startupTimeout.count() <= 0 || config_.healthCheckInterval.count() <= 0) {
        throw std::invalid_argument("Startup timeout and health check interval must be positive");
    }
    if (config_.maxConsecutiveTimeouts < 1) {
        throw std::invalid_argument("maxConsecutiveTimeouts must be at least 1");
    }
    
    for (auto& strategy : strategies) {
        if (!strategy.sampler) {
            throw std::invalid_argument("Strategy '" + strategy.name + "' has no sampler");
        }
        if (strategy.name.empty()) {
            strategy.name = strategy.sampler->name();
        }
        strategies_.push_back(Entry{std::move(strategy), false, std::nullopt});
    }
}

StrategySelector::~StrategySelector() {
    active_.store(false);
    std::lock_guard<std::mutex> lock(mutex_);
    teardownActiveLocked();
}

void StrategySelector::setSampleHandler(SampleHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    sampleHandler_ = std::move(handler);
}

void StrategySelector::setStatusHandler(StatusHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    statusHandler_ = std::move(handler);
}

TrackingResult StrategySelector::start(const std::string& userId, const SamplingParameters& params) {
    if (userId.empty()) {
        return TrackingResult::failure(TrackingError::InvalidArgument, "User id must not be empty");
    }
    
    Outbox out;
    TrackingResult result = TrackingResult::success();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_.load()) {
            return TrackingResult::failure(TrackingError::InvalidArgument,
                                           "Tracking session already active for " + session_->userId);
        }
        if (strategies_.empty()) {
            return TrackingResult::failure(TrackingError::InvalidArgument, "No tracking strategies configured");
        }
        
        auto now = clock_->now();
        for (auto& entry : strategies_) {
            entry.failedThisSession = false;
            entry.excludedUntil.reset();
        }
        
        auto granted = permissions_->locationPermission();
        if (!firstEligibleLocked(granted, now)) {
            std::string message = granted == ports::PermissionLevel::Denied
                ? "Location permission not granted"
                : "No tracking strategy is allowed at the granted permission level";
            std::cerr << "[StrategySelector] " << message << std::endl;
            setStateLocked(state_, "", TrackingError::PermissionDenied, message, out, now);
            result = TrackingResult::failure(TrackingError::PermissionDenied, message);
        } else {
            session_ = TrackingSession{userId, now, "", true};
            params_ = params;
            recoveryAttempts_ = 0;
            active_.store(true);
            std::cout << "[StrategySelector] Session started for " << userId << std::endl;
            attemptNextLocked(out, now);
        }
    }
    flush(out);
    return result;
}

void StrategySelector::stop() {
    active_.store(false);
    
    Outbox out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        teardownActiveLocked();
        ++generation_;
        session_.reset();
        
        if (state_ != TrackingState::Stopped) {
            std::cout << "[StrategySelector] Tracking stopped" << std::endl;
            setStateLocked(TrackingState::Stopped, "", TrackingError::None, "Tracking stopped", out, clock_->now());
        }
    }
    flush(out);
}

void StrategySelector::onStrategyHealthCheck() {
    Outbox out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_.load() && state_ == TrackingState::Running) {
            healthCheckLocked(out, clock_->now());
        }
    }
    flush(out);
}

void StrategySelector::tick() {
    Outbox out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_.load()) return;
        
        auto now = clock_->now();
        switch (state_) {
            case TrackingState::Starting:
                if (activeIndex_ && now >= startupDeadline_) {
                    startupFailedLocked("no sample within startup timeout", out, now);
                }
                break;
                
            case TrackingState::Running:
                if (activeIndex_ && strategies_[*activeIndex_].strategy.mode == StrategyMode::Polling) {
                    if (pollInFlight_ && now >= pollDeadline_) {
                        pollInFlight_ = false;
                        ++pollId_; // a late answer to the abandoned poll is ignored
                        cycleTimedOutLocked(out, now);
                    } else if (!pollInFlight_ && now >= nextPollAt_) {
                        issuePollLocked(now);
                    }
                }
                if (state_ == TrackingState::Running && now >= nextHealthCheckAt_) {
                    healthCheckLocked(out, now);
                }
                break;
                
            case TrackingState::Degraded:
                if (now >= nextRecoveryAt_) {
                    std::cout << "[StrategySelector] Retrying strategy list (attempt "
                              << recoveryAttempts_ << ")" << std::endl;
                    for (auto& entry : strategies_) {
                        entry.failedThisSession = false;
                        entry.excludedUntil.reset();
                    }
                    attemptNextLocked(out, now);
                }
                break;
                
            default:
                break;
        }
    }
    flush(out);
}

void StrategySelector::reconfigure(const SamplingParameters& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (params == params_) return;
    params_ = params;
    
    if (!active_.load() || !activeIndex_) return;
    
    auto& entry = strategies_[*activeIndex_];
    std::cout << "[StrategySelector] Reconfiguring " << entry.strategy.name
              << ": interval " << params_.sampleInterval.count() << "ms, "
              << accuracyClassToString(params_.accuracy) << " accuracy" << std::endl;
    
    expectedInterval_ = std::max(expectedInterval_, params_.sampleInterval);
    if (entry.strategy.mode == StrategyMode::Subscription) {
        entry.strategy.sampler->updateSubscription(updateRequestLocked());
    } else if (!pollInFlight_) {
        auto candidate = clock_->now() + params_.sampleInterval;
        if (candidate < nextPollAt_) {
            nextPollAt_ = candidate;
        }
    }
}

TrackingState StrategySelector::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string StrategySelector::activeStrategy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activeNameLocked();
}

std::optional<TrackingSession> StrategySelector::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

SamplingParameters StrategySelector::parameters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return params_;
}

void StrategySelector::deliverSample(uint64_t generation, uint64_t pollId, const LocationSample& sample) {
    Outbox out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_.load() || generation != generation_ || !activeIndex_) return;
        if (pollId != 0 && (pollId != pollId_ || !pollInFlight_)) return;
        
        auto now = clock_->now();
        if (pollId != 0) {
            pollInFlight_ = false;
            nextPollAt_ = now + params_.sampleInterval;
        }
        lastSampleAt_ = now;
        expectedInterval_ = params_.sampleInterval;
        consecutiveTimeouts_ = 0;
        
        if (state_ == TrackingState::Starting) {
            const auto& name = strategies_[*activeIndex_].strategy.name;
            recoveryAttempts_ = 0;
            nextHealthCheckAt_ = now + config_.healthCheckInterval;
            std::cout << "[StrategySelector] Strategy " << name << " running" << std::endl;
            setStateLocked(TrackingState::Running, name, TrackingError::None, name + " delivering samples", out, now);
        }
        if (state_ == TrackingState::Running) {
            out.samples.push_back(sample);
        }
    }
    flush(out);
}

void StrategySelector::deliverError(uint64_t generation, uint64_t pollId, const TrackingResult& error) {
    Outbox out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_.load() || generation != generation_ || !activeIndex_) return;
        if (pollId != 0 && (pollId != pollId_ || !pollInFlight_)) return;
        
        auto now = clock_->now();
        if (pollId != 0) {
            pollInFlight_ = false;
        }
        
        std::string message = error.message.empty() ? trackingErrorToString(error.error) : error.message;
        if (isSessionFatal(error.error)) {
            endSessionLocked(TrackingState::Idle, error.error, message, out, now);
        } else if (state_ == TrackingState::Starting) {
            startupFailedLocked(message, out, now);
        } else if (error.error == TrackingError::SampleTimeout) {
            cycleTimedOutLocked(out, now);
        } else {
            strategyFailedLocked(message, TrackingError::ProviderUnavailable, out, now);
        }
    }
    flush(out);
}

void StrategySelector::attemptNextLocked(Outbox& out, Timestamp now) {
    while (active_.load()) {
        auto granted = permissions_->locationPermission();
        if (granted == ports::PermissionLevel::Denied) {
            endSessionLocked(TrackingState::Idle, TrackingError::PermissionDenied,
                             "Location permission revoked", out, now);
            return;
        }
        
        auto index = firstEligibleLocked(granted, now);
        if (!index) {
            enterDegradedLocked(out, now);
            return;
        }
        
        if (activateLocked(*index, out, now)) return;
    }
}

bool StrategySelector::activateLocked(size_t index, Outbox& out, Timestamp now) {
    auto& entry = strategies_[index];
    const std::string name = entry.strategy.name;
    
    activeIndex_ = index;
    ++generation_;
    consecutiveTimeouts_ = 0;
    expectedInterval_ = params_.sampleInterval;
    pollInFlight_ = false;
    startupDeadline_ = now + config_.startupTimeout;
    if (session_) {
        session_->activeStrategy = name;
    }
    
    std::cout << "[StrategySelector] Starting strategy " << name << std::endl;
    setStateLocked(TrackingState::Starting, name, TrackingError::None, "Starting " + name, out, now);
    
    if (entry.strategy.mode == StrategyMode::Polling) {
        issuePollLocked(now);
        return true;
    }
    
    uint64_t generation = generation_;
    std::weak_ptr<int> alive = lifetime_;
    auto dispatcher = dispatcher_;
    
    auto onSample = [this, alive, dispatcher, generation](const LocationSample& sample) {
        dispatcher->post([this, alive, generation, sample] {
            if (alive.expired()) return;
            deliverSample(generation, 0, sample);
        });
    };
    auto onError = [this, alive, dispatcher, generation](const TrackingResult& error) {
        dispatcher->post([this, alive, generation, error] {
            if (alive.expired()) return;
            deliverError(generation, 0, error);
        });
    };
    
    auto result = entry.strategy.sampler->subscribe(updateRequestLocked(), onSample, onError);
    if (result.ok()) {
        return true;
    }
    
    activeIndex_.reset();
    ++generation_;
    if (isSessionFatal(result.error)) {
        endSessionLocked(TrackingState::Idle, result.error, result.message, out, now);
        return false;
    }
    
    std::cerr << "[StrategySelector] Strategy " << name << " failed to start: " << result.message << std::endl;
    entry.failedThisSession = true;
    return false;
}

void StrategySelector::issuePollLocked(Timestamp now) {
    auto& entry = strategies_[*activeIndex_];
    
    ports::PositionRequest request;
    request.accuracy = params_.accuracy;
    request.timeout = config_.startupTimeout;
    
    uint64_t generation = generation_;
    uint64_t pollId = ++pollId_;
    pollInFlight_ = true;
    pollDeadline_ = now + request.timeout + POLL_GRACE;
    
    std::weak_ptr<int> alive = lifetime_;
    auto dispatcher = dispatcher_;
    
    entry.strategy.sampler->getCurrentPosition(request,
        [this, alive, dispatcher, generation, pollId](std::optional<LocationSample> sample, TrackingResult result) {
            dispatcher->post([this, alive, generation, pollId, sample, result] {
                if (alive.expired()) return;
                if (sample) {
                    deliverSample(generation, pollId, *sample);
                } else if (!result.ok()) {
                    deliverError(generation, pollId, result);
                } else {
                    deliverError(generation, pollId,
                                 TrackingResult::failure(TrackingError::ProviderUnavailable, "Empty position result"));
                }
            });
        });
}

void StrategySelector::teardownActiveLocked() {
    if (!activeIndex_) return;
    
    auto& entry = strategies_[*activeIndex_];
    if (entry.strategy.mode == StrategyMode::Subscription) {
        entry.strategy.sampler->unsubscribe();
    }
    
    activeIndex_.reset();
    ++generation_;
    pollInFlight_ = false;
    consecutiveTimeouts_ = 0;
    if (session_) {
        session_->activeStrategy.clear();
    }
}

void StrategySelector::strategyFailedLocked(const std::string& reason, TrackingError error,
                                            Outbox& out, Timestamp now) {
    const std::string name = activeNameLocked();
    std::cerr << "[StrategySelector] Strategy " << name << " failed: " << reason << std::endl;
    
    if (activeIndex_) {
        strategies_[*activeIndex_].excludedUntil = now + config_.failedStrategyBackoff;
    }
    teardownActiveLocked();
    
    setStateLocked(TrackingState::Recovering, name, error, name + ": " + reason, out, now);
    attemptNextLocked(out, now);
}

void StrategySelector::startupFailedLocked(const std::string& reason, Outbox& out, Timestamp now) {
    std::cerr << "[StrategySelector] Strategy " << activeNameLocked() << " failed to start: " << reason << std::endl;
    
    if (activeIndex_) {
        strategies_[*activeIndex_].failedThisSession = true;
    }
    teardownActiveLocked();
    attemptNextLocked(out, now);
}

void StrategySelector::cycleTimedOutLocked(Outbox& out, Timestamp now) {
    ++consecutiveTimeouts_;
    std::cerr << "[StrategySelector] Sample timeout on " << activeNameLocked()
              << " (" << consecutiveTimeouts_ << "/" << config_.maxConsecutiveTimeouts << ")" << std::endl;
    
    if (consecutiveTimeouts_ >= config_.maxConsecutiveTimeouts) {
        strategyFailedLocked(std::to_string(consecutiveTimeouts_) + " consecutive sample timeouts",
                             TrackingError::SampleTimeout, out, now);
        return;
    }
    
    nextPollAt_ = now + params_.sampleInterval;
}

std::chrono::milliseconds StrategySelector::silenceAllowanceLocked() const {
    auto allowance = expectedInterval_ * 2;
    // A poll may take up to its timeout to answer after it is issued
    if (activeIndex_ && strategies_[*activeIndex_].strategy.mode == StrategyMode::Polling) {
        allowance += config_.startupTimeout + POLL_GRACE;
    }
    return allowance;
}

void StrategySelector::healthCheckLocked(Outbox& out, Timestamp now) {
    nextHealthCheckAt_ = now + config_.healthCheckInterval;
    if (state_ != TrackingState::Running || !activeIndex_) return;
    
    auto silence = now - lastSampleAt_;
    if (silence > silenceAllowanceLocked()) {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(silence).count();
        strategyFailedLocked("no sample for " + std::to_string(seconds) + "s",
                             TrackingError::ProviderUnavailable, out, now);
        return;
    }
    
    auto granted = permissions_->locationPermission();
    if (granted == ports::PermissionLevel::Denied) {
        endSessionLocked(TrackingState::Idle, TrackingError::PermissionDenied,
                         "Location permission revoked", out, now);
        return;
    }
    
    // Promote back to a more capable strategy once its backoff window has passed
    auto best = firstEligibleLocked(granted, now);
    if (best && *best < *activeIndex_) {
        std::cout << "[StrategySelector] Promoting to " << strategies_[*best].strategy.name << std::endl;
        teardownActiveLocked();
        attemptNextLocked(out, now);
    }
}

void StrategySelector::enterDegradedLocked(Outbox& out, Timestamp now) {
    teardownActiveLocked();
    
    ++recoveryAttempts_;
    auto delay = policyEngine_->getRecoveryBackoffPolicy().getBackoffDelay(recoveryAttempts_);
    nextRecoveryAt_ = now + delay;
    
    std::cerr << "[StrategySelector] All strategies exhausted, retrying in "
              << std::chrono::duration_cast<std::chrono::seconds>(delay).count() << "s" << std::endl;
    setStateLocked(TrackingState::Degraded, "", TrackingError::AllStrategiesExhausted,
                   "No tracking strategy available", out, now);
}

void StrategySelector::endSessionLocked(TrackingState finalState, TrackingError reason,
                                        const std::string& message, Outbox& out, Timestamp now) {
    std::cerr << "[StrategySelector] Session ended: " << message << std::endl;
    
    teardownActiveLocked();
    active_.store(false);
    session_.reset();
    setStateLocked(finalState, "", reason, message, out, now);
}

void StrategySelector::setStateLocked(TrackingState state, const std::string& strategy, TrackingError reason,
                                      const std::string& message, Outbox& out, Timestamp now) {
    if (state != state_) {
        std::cout << "[StrategySelector] " << trackingStateToString(state_)
                  << " -> " << trackingStateToString(state) << std::endl;
    }
    state_ = state;
    
    TrackingStatusEvent event;
    event.state = state;
    event.strategy = strategy;
    event.reason = reason;
    event.message = message;
    event.at = now;
    out.statuses.push_back(std::move(event));
}

bool StrategySelector::isEligibleLocked(const Entry& entry, ports::PermissionLevel granted, Timestamp now) const {
    if (entry.failedThisSession) return false;
    if (entry.excludedUntil && now < *entry.excludedUntil) return false;
    return ports::permissionSatisfies(granted, entry.strategy.requiredPermission);
}

std::optional<size_t> StrategySelector::firstEligibleLocked(ports::PermissionLevel granted, Timestamp now) const {
    for (size_t i = 0; i < strategies_.size(); ++i) {
        if (isEligibleLocked(strategies_[i], granted, now)) {
            return i;
        }
    }
    return std::nullopt;
}

ports::UpdateRequest StrategySelector::updateRequestLocked() const {
    ports::UpdateRequest request;
    request.interval = params_.sampleInterval;
    request.minDisplacementMeters = params_.minDisplacementMeters;
    request.accuracy = params_.accuracy;
    return request;
}

std::string StrategySelector::activeNameLocked() const {
    return activeIndex_ ? strategies_[*activeIndex_].strategy.name : std::string();
}

void StrategySelector::flush(Outbox& out) {
    if (out.statuses.empty() && out.samples.empty()) return;
    
    StatusHandler statusHandler;
    SampleHandler sampleHandler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        statusHandler = statusHandler_;
        sampleHandler = sampleHandler_;
    }
    
    for (const auto& event : out.statuses) {
        if (statusHandler) statusHandler(event);
    }
    for (const auto& sample : out.samples) {
        if (sampleHandler) sampleHandler(sample);
    }
}

} // namespace geoshare::domain
