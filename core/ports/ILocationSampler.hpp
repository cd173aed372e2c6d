#pragma once

#include "../Sampling.hpp"
#include "../TrackingError.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace geoshare::ports {

struct PositionRequest {
    AccuracyClass accuracy = AccuracyClass::High;
    std::chrono::milliseconds timeout{std::chrono::seconds(15)};
};

struct UpdateRequest {
    std::chrono::milliseconds interval{std::chrono::seconds(30)};
    double minDisplacementMeters = 0.0;
    AccuracyClass accuracy = AccuracyClass::High;
};

/**
 * @brief Platform positioning capability, one instance per provider backend.
 *
 * Both the one-shot and the streaming form report through callbacks that may
 * arrive on any thread; the core marshals them onto its own worker.
 *
 * A subscription must deliver at least one fix per interval even when the
 * device is stationary, otherwise health checks treat the backend as dead.
 */
class ILocationSampler {
public:
    virtual ~ILocationSampler() = default;
    
    /// Exactly one call per request: a sample with an ok result, or no sample and an error.
    using PositionCallback = std::function<void(std::optional<LocationSample> sample, TrackingResult result)>;
    using SampleHandler = std::function<void(const LocationSample& sample)>;
    using ErrorHandler = std::function<void(const TrackingResult& error)>;
    
    virtual std::string name() const = 0;
    
    virtual void getCurrentPosition(const PositionRequest& request, PositionCallback callback) = 0;
    
    virtual TrackingResult subscribe(const UpdateRequest& request, SampleHandler onSample, ErrorHandler onError) = 0;
    virtual void updateSubscription(const UpdateRequest& request) = 0;
    virtual void unsubscribe() = 0;
};

} // namespace geoshare::ports
