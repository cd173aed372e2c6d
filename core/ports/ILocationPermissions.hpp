#pragma once

namespace geoshare::ports {

enum class PermissionLevel {
    Denied,
    Foreground,
    Background
};

/// Consent surface. Requesting consent is the UI's job; the core only reads it.
class ILocationPermissions {
public:
    virtual ~ILocationPermissions() = default;
    
    virtual PermissionLevel locationPermission() const = 0;
};

inline bool permissionSatisfies(PermissionLevel granted, PermissionLevel required) {
    return static_cast<int>(granted) >= static_cast<int>(required);
}

} // namespace geoshare::ports
