#pragma once

#include "../Sampling.hpp"
#include <chrono>

namespace geoshare::ports {

struct RetryPolicy {
    virtual ~RetryPolicy() = default;
    virtual std::chrono::milliseconds getBackoffDelay(int attemptCount) const = 0;
    virtual bool shouldRetry(int attemptCount) const = 0;
};

struct SamplingPolicy {
    virtual ~SamplingPolicy() = default;
    virtual SamplingParameters evaluate(const PowerState& power) const = 0;
};

class IPolicyEngine {
public:
    virtual ~IPolicyEngine() = default;
    
    /// Store writes that failed to reach the transport.
    virtual const RetryPolicy& getPublishRetryPolicy() const = 0;
    
    /// Waiting time after every strategy has been exhausted.
    virtual const RetryPolicy& getRecoveryBackoffPolicy() const = 0;
    
    virtual const SamplingPolicy& getSamplingPolicy() const = 0;
};

} // namespace geoshare::ports
