#include "SimulatedClock.hpp"

namespace geoshare::sim {

SimulatedClock::SimulatedClock(Timestamp startTime, bool frozen)
    : simulatedTime_(startTime), realStartTime_(std::chrono::steady_clock::now()), frozen_(frozen) {
}

Timestamp SimulatedClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nowLocked();
}

std::string SimulatedClock::iso8601() const {
    return formatIso8601(now());
}

void SimulatedClock::advance(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ = nowLocked() + duration;
    realStartTime_ = std::chrono::steady_clock::now(); // Reset real time reference
}

void SimulatedClock::setCurrentTime(Timestamp time) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ = time;
    realStartTime_ = std::chrono::steady_clock::now(); // Reset real time reference
}

void SimulatedClock::freezeTime() {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ = nowLocked();
    frozen_ = true;
}

void SimulatedClock::unfreezeTime() {
    std::lock_guard<std::mutex> lock(mutex_);
    realStartTime_ = std::chrono::steady_clock::now();
    frozen_ = false;
}

bool SimulatedClock::isFrozen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frozen_;
}

Timestamp SimulatedClock::nowLocked() const {
    if (frozen_) {
        return simulatedTime_;
    }
    
    // Simulated time plus real time elapsed since the last adjustment
    auto realElapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - realStartTime_);
    return simulatedTime_ + realElapsed;
}

} // namespace geoshare::sim
