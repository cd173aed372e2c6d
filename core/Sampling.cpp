#include "Sampling.hpp"
#include <unordered_map>

namespace geoshare {

bool operator==(const SamplingParameters& a, const SamplingParameters& b) {
    return a.sampleInterval == b.sampleInterval &&
           a.minDisplacementMeters == b.minDisplacementMeters &&
           a.accuracy == b.accuracy &&
           a.publishDeferred == b.publishDeferred;
}

bool operator!=(const SamplingParameters& a, const SamplingParameters& b) {
    return !(a == b);
}

std::string sourceProviderToString(SourceProvider source) {
    static const std::unordered_map<SourceProvider, std::string> sourceMap = {
        {SourceProvider::Gps, "gps"},
        {SourceProvider::Network, "network"},
        {SourceProvider::Fused, "fused"},
        {SourceProvider::Passive, "passive"},
        {SourceProvider::Unknown, "unknown"}
    };
    
    auto it = sourceMap.find(source);
    return (it != sourceMap.end()) ? it->second : "unknown";
}

SourceProvider stringToSourceProvider(const std::string& str) {
    static const std::unordered_map<std::string, SourceProvider> stringMap = {
        {"gps", SourceProvider::Gps},
        {"network", SourceProvider::Network},
        {"fused", SourceProvider::Fused},
        {"passive", SourceProvider::Passive}
    };
    
    auto it = stringMap.find(str);
    return (it != stringMap.end()) ? it->second : SourceProvider::Unknown;
}

std::string accuracyClassToString(AccuracyClass accuracy) {
    switch (accuracy) {
        case AccuracyClass::High: return "high";
        case AccuracyClass::Medium: return "medium";
        case AccuracyClass::Low: return "low";
        default: return "unknown";
    }
}

std::string networkClassToString(NetworkClass network) {
    switch (network) {
        case NetworkClass::Wifi: return "wifi";
        case NetworkClass::Cellular: return "cellular";
        case NetworkClass::None: return "none";
        default: return "unknown";
    }
}

NetworkClass stringToNetworkClass(const std::string& str) {
    if (str == "wifi") return NetworkClass::Wifi;
    if (str == "cellular") return NetworkClass::Cellular;
    return NetworkClass::None;
}

int accuracyRank(AccuracyClass accuracy) {
    switch (accuracy) {
        case AccuracyClass::High: return 0;
        case AccuracyClass::Medium: return 1;
        case AccuracyClass::Low: return 2;
        default: return 2;
    }
}

} // namespace geoshare
