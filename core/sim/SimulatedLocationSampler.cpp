#include "SimulatedLocationSampler.hpp"
#include <cmath>

namespace geoshare::sim {

std::string samplerBehaviorToString(SamplerBehavior behavior) {
    switch (behavior) {
        case SamplerBehavior::Healthy: return "healthy";
        case SamplerBehavior::FailToStart: return "fail-to-start";
        case SamplerBehavior::Timeout: return "timeout";
        case SamplerBehavior::Silent: return "silent";
        case SamplerBehavior::PermissionDenied: return "permission-denied";
        default: return "unknown";
    }
}

SimulatedLocationSampler::SimulatedLocationSampler(std::string name,
                                                   std::shared_ptr<IClock> clock,
                                                   SourceProvider source,
                                                   double accuracyMeters,
                                                   std::shared_ptr<IRng> rng)
    : name_(std::move(name)),
      clock_(std::move(clock)),
      source_(source),
      accuracyMeters_(accuracyMeters),
      rng_(std::move(rng)) {
}

std::string SimulatedLocationSampler::name() const {
    return name_;
}

void SimulatedLocationSampler::getCurrentPosition(const ports::PositionRequest& request, PositionCallback callback) {
    std::optional<LocationSample> sample;
    TrackingResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++requestCount_;
        
        switch (behavior_) {
            case SamplerBehavior::Healthy:
                sample = makeSampleLocked(clock_->now());
                break;
            case SamplerBehavior::FailToStart:
                result = TrackingResult::failure(TrackingError::ProviderUnavailable, name_ + " provider unavailable");
                break;
            case SamplerBehavior::Timeout:
                result = TrackingResult::failure(TrackingError::SampleTimeout,
                                                 name_ + " no fix within " + std::to_string(request.timeout.count()) + "ms");
                break;
            case SamplerBehavior::PermissionDenied:
                result = TrackingResult::failure(TrackingError::PermissionDenied, name_ + " permission denied");
                break;
            case SamplerBehavior::Silent:
                return;
        }
    }
    
    if (callback) {
        callback(sample, result);
    }
}

TrackingResult SimulatedLocationSampler::subscribe(const ports::UpdateRequest& request,
                                                   SampleHandler onSample, ErrorHandler onError) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++requestCount_;
    
    if (behavior_ == SamplerBehavior::FailToStart) {
        return TrackingResult::failure(TrackingError::ProviderUnavailable, name_ + " provider unavailable");
    }
    if (behavior_ == SamplerBehavior::PermissionDenied) {
        return TrackingResult::failure(TrackingError::PermissionDenied, name_ + " permission denied");
    }
    
    subscription_ = request;
    onSample_ = std::move(onSample);
    onError_ = std::move(onError);
    lastEmittedAt_.reset();
    return TrackingResult::success();
}

void SimulatedLocationSampler::updateSubscription(const ports::UpdateRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (subscription_) {
        subscription_ = request;
    }
}

void SimulatedLocationSampler::unsubscribe() {
    std::lock_guard<std::mutex> lock(mutex_);
    subscription_.reset();
    onSample_ = nullptr;
    onError_ = nullptr;
    lastEmittedAt_.reset();
}

void SimulatedLocationSampler::tick() {
    SampleHandler onSample;
    ErrorHandler onError;
    std::optional<LocationSample> sample;
    TrackingResult error;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!subscription_) return;
        
        auto now = clock_->now();
        if (lastEmittedAt_ && now - *lastEmittedAt_ < subscription_->interval) return;
        
        switch (behavior_) {
            case SamplerBehavior::Healthy:
                sample = makeSampleLocked(now);
                break;
            case SamplerBehavior::Timeout:
                error = TrackingResult::failure(TrackingError::SampleTimeout, name_ + " update timed out");
                break;
            case SamplerBehavior::FailToStart:
                error = TrackingResult::failure(TrackingError::ProviderUnavailable, name_ + " provider lost");
                break;
            case SamplerBehavior::PermissionDenied:
                error = TrackingResult::failure(TrackingError::PermissionDenied, name_ + " permission revoked");
                break;
            case SamplerBehavior::Silent:
                return;
        }
        
        lastEmittedAt_ = now;
        onSample = onSample_;
        onError = onError_;
    }
    
    if (sample) {
        if (onSample) onSample(*sample);
    } else if (onError) {
        onError(error);
    }
}

void SimulatedLocationSampler::setBehavior(SamplerBehavior behavior) {
    std::lock_guard<std::mutex> lock(mutex_);
    behavior_ = behavior;
}

SamplerBehavior SimulatedLocationSampler::behavior() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return behavior_;
}

void SimulatedLocationSampler::setPosition(const GeoPoint& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    position_ = position;
    route_.clear();
}

void SimulatedLocationSampler::setRoute(std::vector<GeoPoint> route, std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    route_ = std::move(route);
    routeDuration_ = duration;
    routeStartedAt_ = clock_->now();
    if (!route_.empty()) {
        position_ = route_.front();
    }
}

GeoPoint SimulatedLocationSampler::position() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positionLocked(clock_->now());
}

bool SimulatedLocationSampler::isSubscribed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscription_.has_value();
}

std::optional<ports::UpdateRequest> SimulatedLocationSampler::subscription() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscription_;
}

int SimulatedLocationSampler::requestCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requestCount_;
}

LocationSample SimulatedLocationSampler::makeSampleLocked(Timestamp now) const {
    GeoPoint point = positionLocked(now);
    
    if (rng_) {
        double offset = std::abs(rng_->normal(0.0, accuracyMeters_ / 2.0));
        point = Geo::movePoint(point, rng_->uniform(0.0, 360.0), offset);
    }
    
    LocationSample sample;
    sample.lat = point.lat;
    sample.lng = point.lng;
    sample.accuracyMeters = accuracyMeters_;
    sample.capturedAt = now;
    sample.source = source_;
    return sample;
}

GeoPoint SimulatedLocationSampler::positionLocked(Timestamp now) const {
    if (route_.size() < 2 || routeDuration_.count() <= 0) {
        return position_;
    }
    
    double progress = static_cast<double>((now - routeStartedAt_).count()) / routeDuration_.count();
    return Geo::interpolateRoute(route_, progress);
}

} // namespace geoshare::sim
