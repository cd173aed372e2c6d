#include "BatteryAdaptationPolicy.hpp"
#include <algorithm>
#include <cmath>

namespace geoshare::domain {

namespace {

std::chrono::milliseconds seconds(double value) {
    return std::chrono::milliseconds(static_cast<long long>(std::llround(value * 1000.0)));
}

} // namespace

BatteryAdaptationPolicy::BatteryAdaptationPolicy(DevicePowerProfile profile)
    : profile_(std::move(profile)) {
}

SamplingParameters BatteryAdaptationPolicy::evaluate(const PowerState& power) const {
    double level = std::isfinite(power.batteryLevel) ? std::clamp(power.batteryLevel, 0.0, 100.0) : 0.0;
    
    SamplingParameters params;
    
    if (power.isCharging) {
        params.sampleInterval = seconds(lerp(15.0, 10.0, level / 100.0));
        params.minDisplacementMeters = 5.0;
        params.accuracy = AccuracyClass::High;
    } else if (level >= LOW_BATTERY_THRESHOLD && !power.isPowerSaveMode) {
        double fraction = (level - LOW_BATTERY_THRESHOLD) / (100.0 - LOW_BATTERY_THRESHOLD);
        params.sampleInterval = seconds(lerp(30.0, 15.0, fraction));
        params.minDisplacementMeters = 10.0;
        params.accuracy = AccuracyClass::High;
    } else {
        params.sampleInterval = seconds(lerp(60.0, 30.0, level / 100.0));
        params.minDisplacementMeters = lerp(50.0, 25.0, level / 100.0);
        params.accuracy = level >= CRITICAL_BATTERY_THRESHOLD ? AccuracyClass::Medium : AccuracyClass::Low;
    }
    
    if (power.deviceClass == DeviceClass::AggressiveOem && profile_.maxInterval.count() > 0) {
        params.sampleInterval = std::min(params.sampleInterval, profile_.maxInterval);
    }
    
    params.publishDeferred = power.network == NetworkClass::None;
    return params;
}

double BatteryAdaptationPolicy::lerp(double atEmpty, double atFull, double fraction) {
    return atEmpty + (atFull - atEmpty) * std::clamp(fraction, 0.0, 1.0);
}

} // namespace geoshare::domain
