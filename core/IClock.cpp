#include "IClock.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace geoshare {

std::string SystemClock::iso8601() const {
    return formatIso8601(now());
}

std::string formatIso8601(Timestamp time) {
    auto time_t = std::chrono::system_clock::to_time_t(time);
    auto ms = time.time_since_epoch() % std::chrono::seconds(1);
    if (ms.count() < 0) {
        ms += std::chrono::seconds(1);
        time_t -= 1;
    }
    
    std::stringstream ss;
    
    // Use thread-safe gmtime_s on Windows, gmtime_r on other platforms
#ifdef _WIN32
    std::tm tm_buf{};
    if (gmtime_s(&tm_buf, &time_t) == 0) {
        ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    }
#else
    std::tm tm_buf{};
    if (gmtime_r(&time_t, &tm_buf)) {
        ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    }
#endif
    
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

} // namespace geoshare
