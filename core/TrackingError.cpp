#include "TrackingError.hpp"

namespace geoshare {

std::string trackingErrorToString(TrackingError error) {
    switch (error) {
        case TrackingError::None: return "none";
        case TrackingError::PermissionDenied: return "permission_denied";
        case TrackingError::ProviderUnavailable: return "provider_unavailable";
        case TrackingError::SampleTimeout: return "sample_timeout";
        case TrackingError::PublishFailure: return "publish_failure";
        case TrackingError::AllStrategiesExhausted: return "all_strategies_exhausted";
        case TrackingError::InvalidArgument: return "invalid_argument";
        default: return "unknown";
    }
}

bool isSessionFatal(TrackingError error) {
    return error == TrackingError::PermissionDenied;
}

} // namespace geoshare
