#pragma once

#include "../IClock.hpp"
#include <chrono>
#include <mutex>
#include <string>

namespace geoshare::sim {

/// 2025-01-01T00:00:00Z
constexpr int64_t kDefaultSimulationEpochMs = 1735689600000;

class SimulatedClock : public IClock {
public:
    explicit SimulatedClock(Timestamp startTime = fromEpochMs(kDefaultSimulationEpochMs), bool frozen = true);
    ~SimulatedClock() override = default;

    // IClock interface
    Timestamp now() const override;
    std::string iso8601() const override;

    // Simulation controls
    void advance(std::chrono::milliseconds duration);
    void setCurrentTime(Timestamp time);
    
    // Time manipulation for testing
    void freezeTime();
    void unfreezeTime();
    bool isFrozen() const;

private:
    mutable std::mutex mutex_;
    Timestamp simulatedTime_;
    std::chrono::steady_clock::time_point realStartTime_;
    bool frozen_;
    
    Timestamp nowLocked() const;
};

} // namespace geoshare::sim
