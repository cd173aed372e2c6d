#pragma once

#include "../ports/IPolicyEngine.hpp"
#include "../Sampling.hpp"
#include <chrono>
#include <string>

namespace geoshare::domain {

/// Per-manufacturer power-management workaround, looked up from the device profile table.
struct DevicePowerProfile {
    std::string manufacturer;
    DeviceClass deviceClass = DeviceClass::Standard;
    std::chrono::milliseconds maxInterval{std::chrono::seconds(60)};
    bool requestExemption = false;
};

/**
 * @brief Maps power and network conditions to sampling parameters.
 *
 * | condition                 | interval       | displacement | accuracy        |
 * |---------------------------|----------------|--------------|-----------------|
 * | charging                  | 10-15 s        | 5 m          | high            |
 * | >= 30 %, no power saving  | 15-30 s        | 10 m         | high            |
 * | < 30 % or power saving    | 30-60 s        | 25-50 m      | medium / low    |
 * | no network                | as above       | as above     | publish deferred|
 *
 * Intervals and displacements are linear in battery level. For a fixed charging
 * and power-save state, a lower level never yields a shorter interval, a smaller
 * displacement or a better accuracy class. Aggressive-OEM devices have their
 * interval capped at the profile's maxInterval.
 */
class BatteryAdaptationPolicy : public ports::SamplingPolicy {
public:
    explicit BatteryAdaptationPolicy(DevicePowerProfile profile = {});

    SamplingParameters evaluate(const PowerState& power) const override;
    
    const DevicePowerProfile& profile() const { return profile_; }

    static constexpr double LOW_BATTERY_THRESHOLD = 30.0;
    static constexpr double CRITICAL_BATTERY_THRESHOLD = 15.0;

private:
    static double lerp(double atEmpty, double atFull, double fraction);

    DevicePowerProfile profile_;
};

} // namespace geoshare::domain
