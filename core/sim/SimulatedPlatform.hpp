#pragma once

#include "../ports/ILocationPermissions.hpp"
#include "../ports/IPowerExemption.hpp"
#include <atomic>
#include <string>
#include <vector>

namespace geoshare::sim {

class StaticLocationPermissions : public ports::ILocationPermissions {
public:
    explicit StaticLocationPermissions(ports::PermissionLevel level = ports::PermissionLevel::Background)
        : level_(level) {}

    ports::PermissionLevel locationPermission() const override { return level_.load(); }
    
    void setPermission(ports::PermissionLevel level) { level_.store(level); }

private:
    std::atomic<ports::PermissionLevel> level_;
};

/// Records exemption requests; grants them unless told otherwise.
class SimulatedPowerExemption : public ports::IPowerExemption {
public:
    explicit SimulatedPowerExemption(bool grant = true) : grant_(grant) {}

    bool requestExemption(const std::string& manufacturer) override {
        requests_.push_back(manufacturer);
        return grant_;
    }
    
    const std::vector<std::string>& requests() const { return requests_; }

private:
    bool grant_;
    std::vector<std::string> requests_;
};

} // namespace geoshare::sim
