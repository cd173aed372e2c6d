#include "SimulatedBattery.hpp"

namespace geoshare::sim {

SimulatedBattery::SimulatedBattery(std::shared_ptr<IRng> rng, double percentage)
    : rng_(std::move(rng)), percentage_(std::clamp(percentage, 0.0, 100.0)) {}

void SimulatedBattery::tick(double deltaSeconds, bool tracking) {
    if (charging_) {
        percentage_ = std::clamp(percentage_ + (CHARGE_PER_HOUR / 3600.0) * deltaSeconds, 0.0, 100.0);
        return;
    }
    
    double drainRate = tracking ? TRACKING_DRAIN_PER_HOUR : IDLE_DRAIN_PER_HOUR;
    double baseDrain = (drainRate / 3600.0) * deltaSeconds;
    
    double jitter = rng_ ? rng_->uniform(-0.1, 0.1) : 0.0;
    double actualDrain = baseDrain * (1.0 + jitter);
    
    percentage_ = std::clamp(percentage_ - actualDrain, 0.0, 100.0);
}

PowerState SimulatedBattery::powerState() const {
    PowerState state;
    state.batteryLevel = percentage_;
    state.isCharging = charging_;
    // Platforms switch the saver on by themselves near empty
    state.isPowerSaveMode = powerSave_ || (!charging_ && percentage_ < AUTO_SAVER_THRESHOLD);
    state.network = network_;
    state.deviceClass = deviceClass_;
    return state;
}

} // namespace geoshare::sim
