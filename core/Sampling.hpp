#pragma once

#include "IClock.hpp"
#include <chrono>
#include <string>

namespace geoshare {

enum class SourceProvider {
    Gps,
    Network,
    Fused,
    Passive,
    Unknown
};

enum class AccuracyClass {
    High,
    Medium,
    Low
};

enum class NetworkClass {
    Wifi,
    Cellular,
    None
};

/// Manufacturer power-management behaviour, resolved from the device profile table.
enum class DeviceClass {
    Standard,
    AggressiveOem
};

/**
 * @brief One position fix as delivered by a platform positioning backend.
 *
 * Immutable once created; passed by value through the pipeline.
 */
struct LocationSample {
    double lat = 0.0;
    double lng = 0.0;
    double accuracyMeters = 0.0;
    Timestamp capturedAt{};
    SourceProvider source = SourceProvider::Unknown;
};

struct PowerState {
    double batteryLevel = 100.0;          ///< 0..100
    bool isCharging = false;
    bool isPowerSaveMode = false;
    NetworkClass network = NetworkClass::Wifi;
    DeviceClass deviceClass = DeviceClass::Standard;
};

/// Output of the battery adaptation policy, consumed before each sampling cycle.
struct SamplingParameters {
    std::chrono::milliseconds sampleInterval{std::chrono::seconds(30)};
    double minDisplacementMeters = 10.0;
    AccuracyClass accuracy = AccuracyClass::High;
    bool publishDeferred = false;         ///< No network: keep sampling, hold publishes
};

bool operator==(const SamplingParameters& a, const SamplingParameters& b);
bool operator!=(const SamplingParameters& a, const SamplingParameters& b);

std::string sourceProviderToString(SourceProvider source);
SourceProvider stringToSourceProvider(const std::string& str);

std::string accuracyClassToString(AccuracyClass accuracy);
std::string networkClassToString(NetworkClass network);
NetworkClass stringToNetworkClass(const std::string& str);

/// Lower rank = more precise; used for monotonicity comparisons.
int accuracyRank(AccuracyClass accuracy);

} // namespace geoshare
