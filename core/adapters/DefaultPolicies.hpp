#pragma once

#include "../ports/IPolicyEngine.hpp"
#include "../domain/BatteryAdaptationPolicy.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace geoshare::adapters {

class ExponentialBackoffRetryPolicy : public ports::RetryPolicy {
public:
    ExponentialBackoffRetryPolicy(std::chrono::milliseconds baseDelay = std::chrono::milliseconds(1000),
                                double multiplier = 2.0,
                                std::chrono::milliseconds maxDelay = std::chrono::seconds(60),
                                int maxAttempts = 5)
        : baseDelay_(baseDelay), multiplier_(multiplier), maxDelay_(maxDelay), maxAttempts_(maxAttempts) {}

    std::chrono::milliseconds getBackoffDelay(int attemptCount) const override {
        double delayMs = baseDelay_.count() * std::pow(multiplier_, std::max(attemptCount, 1) - 1);
        if (!std::isfinite(delayMs) || delayMs >= static_cast<double>(maxDelay_.count())) {
            return maxDelay_;
        }
        return std::chrono::milliseconds(static_cast<long long>(delayMs));
    }

    bool shouldRetry(int attemptCount) const override {
        return attemptCount < maxAttempts_;
    }

private:
    std::chrono::milliseconds baseDelay_;
    double multiplier_;
    std::chrono::milliseconds maxDelay_;
    int maxAttempts_;
};

class DefaultPolicyEngine : public ports::IPolicyEngine {
public:
    explicit DefaultPolicyEngine(domain::DevicePowerProfile profile = {})
        : recoveryPolicy_(std::chrono::seconds(30), 2.0, std::chrono::minutes(10),
                          std::numeric_limits<int>::max()),
          samplingPolicy_(std::move(profile)) {}

    const ports::RetryPolicy& getPublishRetryPolicy() const override {
        return publishPolicy_;
    }

    const ports::RetryPolicy& getRecoveryBackoffPolicy() const override {
        return recoveryPolicy_;
    }

    const ports::SamplingPolicy& getSamplingPolicy() const override {
        return samplingPolicy_;
    }
    
    const domain::DevicePowerProfile& deviceProfile() const {
        return samplingPolicy_.profile();
    }

private:
    ExponentialBackoffRetryPolicy publishPolicy_;
    ExponentialBackoffRetryPolicy recoveryPolicy_;
    domain::BatteryAdaptationPolicy samplingPolicy_;
};

} // namespace geoshare::adapters
