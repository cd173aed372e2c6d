#pragma once

#include "Sampling.hpp"
#include <vector>
#include <string>

namespace geoshare {

struct GeoPoint {
    double lat = 0.0;
    double lng = 0.0;
};

/// Fixed circular region evaluated locally against peer samples.
struct GeofenceRegion {
    std::string id;
    GeoPoint center;
    double radiusMeters = 100.0;
    std::string label;
};

class Geo {
public:
    /// Great-circle distance (haversine). Finite for any finite input, including antipodes and poles.
    static double distanceMeters(double lat1, double lng1, double lat2, double lng2);
    static double distanceMeters(const GeoPoint& a, const GeoPoint& b);
    static double distanceMeters(const LocationSample& a, const LocationSample& b);
    
    static double bearingDegrees(double lat1, double lng1, double lat2, double lng2);
    static std::string cardinalDirection(double bearingDeg);
    
    /// "80m", "400m" (rounded to 100m below 1km), "1.2km".
    static std::string formatDistance(double meters);
    
    static GeoPoint movePoint(const GeoPoint& from, double bearingDeg, double distanceMeters);
    
    static bool isInsideRegion(const GeoPoint& point, const GeofenceRegion& region);
    
    static std::vector<std::string> checkRegions(const GeoPoint& point,
                                                 const std::vector<GeofenceRegion>& regions);
    
    static GeoPoint interpolateRoute(const std::vector<GeoPoint>& route, double progress);
    
    static constexpr double EARTH_RADIUS_METERS = 6371000.0;
    
private:
    static double toRadians(double degrees);
    static double toDegrees(double radians);
};

} // namespace geoshare
