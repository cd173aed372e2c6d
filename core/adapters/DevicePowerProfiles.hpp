#pragma once

#include "../domain/BatteryAdaptationPolicy.hpp"
#include <string>
#include <vector>

namespace geoshare::adapters {

/// Manufacturers known to kill background location work unless the app is whitelisted.
const std::vector<domain::DevicePowerProfile>& knownDevicePowerProfiles();

/// Case-insensitive lookup; unknown manufacturers get the standard profile.
domain::DevicePowerProfile lookupDevicePowerProfile(const std::string& manufacturer);

} // namespace geoshare::adapters
