#pragma once

#include <string>

namespace geoshare {

/**
 * @brief Failure taxonomy shared by the tracking, presence and store layers.
 *
 * The category decides the reaction, not the message:
 * - PermissionDenied ends the session, strategies are not retried
 * - ProviderUnavailable triggers failover to the next strategy
 * - SampleTimeout abandons the current cycle only
 * - PublishFailure is retried with bounded backoff, then dropped
 * - AllStrategiesExhausted keeps the session alive in a degraded state
 */
enum class TrackingError {
    None = 0,
    PermissionDenied,
    ProviderUnavailable,
    SampleTimeout,
    PublishFailure,
    AllStrategiesExhausted,
    InvalidArgument
};

/// Result of an operation that either succeeds or reports a specific reason.
struct TrackingResult {
    TrackingError error = TrackingError::None;
    std::string message;
    
    bool ok() const { return error == TrackingError::None; }
    explicit operator bool() const { return ok(); }
    
    static TrackingResult success() { return {}; }
    static TrackingResult failure(TrackingError error, std::string message) {
        return TrackingResult{error, std::move(message)};
    }
};

std::string trackingErrorToString(TrackingError error);

/// Errors that terminate a tracking session instead of triggering failover.
bool isSessionFatal(TrackingError error);

} // namespace geoshare
