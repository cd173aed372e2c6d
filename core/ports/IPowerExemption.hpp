#pragma once

#include <string>

namespace geoshare::ports {

/// Best-effort request to exclude the app from OEM battery optimisation.
class IPowerExemption {
public:
    virtual ~IPowerExemption() = default;
    
    /// Returns false if the platform refused or has no such mechanism.
    virtual bool requestExemption(const std::string& manufacturer) = 0;
};

} // namespace geoshare::ports
