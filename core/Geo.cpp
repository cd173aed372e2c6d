#include "Geo.hpp"
#include <cmath>
#include <algorithm>
#include <sstream>
#include <iomanip>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace geoshare {

double Geo::distanceMeters(double lat1, double lng1, double lat2, double lng2) {
    double dLat = toRadians(lat2 - lat1);
    double dLng = toRadians(lng2 - lng1);
    
    double a = std::sin(dLat/2) * std::sin(dLat/2) +
               std::cos(toRadians(lat1)) * std::cos(toRadians(lat2)) *
               std::sin(dLng/2) * std::sin(dLng/2);
    
    // Rounding can push a slightly outside [0, 1] near antipodes and poles.
    a = std::clamp(a, 0.0, 1.0);
    
    double c = 2 * std::asin(std::sqrt(a));
    return EARTH_RADIUS_METERS * c;
}

double Geo::distanceMeters(const GeoPoint& a, const GeoPoint& b) {
    return distanceMeters(a.lat, a.lng, b.lat, b.lng);
}

double Geo::distanceMeters(const LocationSample& a, const LocationSample& b) {
    return distanceMeters(a.lat, a.lng, b.lat, b.lng);
}

double Geo::bearingDegrees(double lat1, double lng1, double lat2, double lng2) {
    double dLng = toRadians(lng2 - lng1);
    double y = std::sin(dLng) * std::cos(toRadians(lat2));
    double x = std::cos(toRadians(lat1)) * std::sin(toRadians(lat2)) -
               std::sin(toRadians(lat1)) * std::cos(toRadians(lat2)) * std::cos(dLng);
    
    double bearing = toDegrees(std::atan2(y, x));
    return std::fmod(bearing + 360.0, 360.0);
}

std::string Geo::cardinalDirection(double bearingDeg) {
    static const char* directions[] = {"N", "NE", "E", "SE", "S", "SW", "W", "NW"};
    double normalized = std::fmod(std::fmod(bearingDeg, 360.0) + 360.0, 360.0);
    int index = static_cast<int>(std::floor((normalized + 22.5) / 45.0)) % 8;
    return directions[index];
}

std::string Geo::formatDistance(double meters) {
    std::ostringstream ss;
    if (meters < 100.0) {
        ss << static_cast<long>(std::lround(meters)) << "m";
    } else if (meters < 1000.0) {
        ss << static_cast<long>(std::lround(meters / 100.0) * 100) << "m";
    } else {
        ss << std::fixed << std::setprecision(1) << (meters / 1000.0) << "km";
    }
    return ss.str();
}

GeoPoint Geo::movePoint(const GeoPoint& from, double bearingDeg, double distanceMeters) {
    double bearing = toRadians(bearingDeg);
    double d = distanceMeters / EARTH_RADIUS_METERS;
    
    double lat1 = toRadians(from.lat);
    double lng1 = toRadians(from.lng);
    
    double lat2 = std::asin(std::clamp(std::sin(lat1) * std::cos(d) +
                                       std::cos(lat1) * std::sin(d) * std::cos(bearing),
                                       -1.0, 1.0));
    
    double lng2 = lng1 + std::atan2(std::sin(bearing) * std::sin(d) * std::cos(lat1),
                                    std::cos(d) - std::sin(lat1) * std::sin(lat2));
    
    GeoPoint result;
    result.lat = toDegrees(lat2);
    result.lng = std::fmod(toDegrees(lng2) + 540.0, 360.0) - 180.0;
    return result;
}

bool Geo::isInsideRegion(const GeoPoint& point, const GeofenceRegion& region) {
    return distanceMeters(point, region.center) <= region.radiusMeters;
}

std::vector<std::string> Geo::checkRegions(const GeoPoint& point,
                                           const std::vector<GeofenceRegion>& regions) {
    std::vector<std::string> inside;
    for (const auto& region : regions) {
        if (isInsideRegion(point, region)) {
            inside.push_back(region.id);
        }
    }
    return inside;
}

GeoPoint Geo::interpolateRoute(const std::vector<GeoPoint>& route, double progress) {
    if (route.empty()) {
        return GeoPoint{};
    }
    
    if (route.size() == 1) {
        return route[0];
    }
    
    progress = std::clamp(progress, 0.0, 1.0);
    double segmentProgress = progress * (route.size() - 1);
    size_t segmentIndex = static_cast<size_t>(segmentProgress);
    double localProgress = segmentProgress - segmentIndex;
    
    if (segmentIndex >= route.size() - 1) {
        return route.back();
    }
    
    const auto& p1 = route[segmentIndex];
    const auto& p2 = route[segmentIndex + 1];
    
    GeoPoint point;
    point.lat = p1.lat + (p2.lat - p1.lat) * localProgress;
    point.lng = p1.lng + (p2.lng - p1.lng) * localProgress;
    return point;
}

double Geo::toRadians(double degrees) {
    return degrees * M_PI / 180.0;
}

double Geo::toDegrees(double radians) {
    return radians * 180.0 / M_PI;
}

} // namespace geoshare
