#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace geoshare {

/// Wall-clock instant with millisecond resolution; the unit used on the wire.
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

inline int64_t toEpochMs(Timestamp t) {
    return t.time_since_epoch().count();
}

inline Timestamp fromEpochMs(int64_t epochMs) {
    return Timestamp(std::chrono::milliseconds(epochMs));
}

class IClock {
public:
    virtual ~IClock() = default;
    
    virtual Timestamp now() const = 0;
    virtual std::string iso8601() const = 0;
};

class SystemClock : public IClock {
public:
    Timestamp now() const override {
        return std::chrono::time_point_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now());
    }
    
    std::string iso8601() const override;
};

std::string formatIso8601(Timestamp time);

} // namespace geoshare
