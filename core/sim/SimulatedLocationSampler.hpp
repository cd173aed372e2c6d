#pragma once

#include "../Geo.hpp"
#include "../IClock.hpp"
#include "../IRng.hpp"
#include "../ports/ILocationSampler.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace geoshare::sim {

enum class SamplerBehavior {
    Healthy,            ///< Answers every request, streams one fix per interval
    FailToStart,        ///< Provider unavailable
    Timeout,            ///< Every request ends in SampleTimeout
    Silent,             ///< Accepts requests and never answers
    PermissionDenied
};

std::string samplerBehaviorToString(SamplerBehavior behavior);

/**
 * @brief Scripted positioning backend driven by the simulated clock.
 *
 * One-shot requests are answered synchronously. The update stream emits from
 * tick() whenever the subscribed interval has elapsed, including when stationary.
 * The position follows a route over a fixed duration, or stays where setPosition()
 * put it. An optional RNG adds Gaussian noise scaled by the reported accuracy.
 */
class SimulatedLocationSampler : public ports::ILocationSampler {
public:
    SimulatedLocationSampler(std::string name,
                             std::shared_ptr<IClock> clock,
                             SourceProvider source = SourceProvider::Gps,
                             double accuracyMeters = 8.0,
                             std::shared_ptr<IRng> rng = nullptr);
    ~SimulatedLocationSampler() override = default;

    // ILocationSampler interface
    std::string name() const override;
    void getCurrentPosition(const ports::PositionRequest& request, PositionCallback callback) override;
    TrackingResult subscribe(const ports::UpdateRequest& request, SampleHandler onSample, ErrorHandler onError) override;
    void updateSubscription(const ports::UpdateRequest& request) override;
    void unsubscribe() override;

    /// Emits a streamed sample if one is due.
    void tick();

    // Scripting
    void setBehavior(SamplerBehavior behavior);
    SamplerBehavior behavior() const;
    void setPosition(const GeoPoint& position);
    void setRoute(std::vector<GeoPoint> route, std::chrono::milliseconds duration);
    GeoPoint position() const;

    bool isSubscribed() const;
    std::optional<ports::UpdateRequest> subscription() const;
    int requestCount() const;

private:
    LocationSample makeSampleLocked(Timestamp now) const;
    GeoPoint positionLocked(Timestamp now) const;

    std::string name_;
    std::shared_ptr<IClock> clock_;
    SourceProvider source_;
    double accuracyMeters_;
    std::shared_ptr<IRng> rng_;
    
    mutable std::mutex mutex_;
    SamplerBehavior behavior_ = SamplerBehavior::Healthy;
    GeoPoint position_;
    std::vector<GeoPoint> route_;
    std::chrono::milliseconds routeDuration_{0};
    Timestamp routeStartedAt_{};
    
    std::optional<ports::UpdateRequest> subscription_;
    SampleHandler onSample_;
    ErrorHandler onError_;
    std::optional<Timestamp> lastEmittedAt_;
    int requestCount_ = 0;
};

} // namespace geoshare::sim
