#include "DevicePowerProfiles.hpp"
#include <algorithm>
#include <cctype>

namespace geoshare::adapters {

namespace {

using std::chrono::seconds;

domain::DevicePowerProfile aggressive(const std::string& manufacturer, seconds maxInterval) {
    domain::DevicePowerProfile profile;
    profile.manufacturer = manufacturer;
    profile.deviceClass = DeviceClass::AggressiveOem;
    profile.maxInterval = maxInterval;
    profile.requestExemption = true;
    return profile;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

const std::vector<domain::DevicePowerProfile>& knownDevicePowerProfiles() {
    static const std::vector<domain::DevicePowerProfile> profiles = {
        aggressive("xiaomi", seconds(20)),
        aggressive("huawei", seconds(20)),
        aggressive("oppo", seconds(25)),
        aggressive("vivo", seconds(25)),
        aggressive("realme", seconds(25)),
        aggressive("oneplus", seconds(30)),
        aggressive("samsung", seconds(30)),
        aggressive("meizu", seconds(30)),
        aggressive("asus", seconds(30)),
    };
    return profiles;
}

domain::DevicePowerProfile lookupDevicePowerProfile(const std::string& manufacturer) {
    auto name = toLower(manufacturer);
    for (const auto& profile : knownDevicePowerProfiles()) {
        if (profile.manufacturer == name) {
            return profile;
        }
    }
    
    domain::DevicePowerProfile standard;
    standard.manufacturer = name;
    return standard;
}

} // namespace geoshare::adapters
