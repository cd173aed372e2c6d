#pragma once

#include "../IRng.hpp"
#include "../Sampling.hpp"
#include <algorithm>
#include <memory>

namespace geoshare::sim {

/// Battery drain/charge model feeding PowerState in the demo.
class SimulatedBattery {
public:
    explicit SimulatedBattery(std::shared_ptr<IRng> rng, double percentage = 100.0);
    
    void tick(double deltaSeconds, bool tracking);
    
    PowerState powerState() const;
    double getPercentage() const { return percentage_; }
    
    void setPercentage(double pct) { percentage_ = std::clamp(pct, 0.0, 100.0); }
    void setCharging(bool charging) { charging_ = charging; }
    void setPowerSaveMode(bool enabled) { powerSave_ = enabled; }
    void setNetwork(NetworkClass network) { network_ = network; }
    void setDeviceClass(DeviceClass deviceClass) { deviceClass_ = deviceClass; }
    
    bool isCharging() const { return charging_; }
    bool isPowerSaveMode() const { return powerSave_; }
    NetworkClass network() const { return network_; }
    
private:
    std::shared_ptr<IRng> rng_;
    double percentage_;
    bool charging_ = false;
    bool powerSave_ = false;
    NetworkClass network_ = NetworkClass::Wifi;
    DeviceClass deviceClass_ = DeviceClass::Standard;
    
    static constexpr double IDLE_DRAIN_PER_HOUR = 1.5;
    static constexpr double TRACKING_DRAIN_PER_HOUR = 6.0;
    static constexpr double CHARGE_PER_HOUR = 40.0;
    static constexpr double AUTO_SAVER_THRESHOLD = 15.0;
};

} // namespace geoshare::sim
