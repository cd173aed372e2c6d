#include "KeyPattern.hpp"
#include <vector>

namespace geoshare {

namespace {

std::vector<std::string> splitLevels(const std::string& value) {
    std::vector<std::string> levels;
    std::string::size_type start = 0;
    while (true) {
        auto slash = value.find('/', start);
        if (slash == std::string::npos) {
            levels.push_back(value.substr(start));
            break;
        }
        levels.push_back(value.substr(start, slash - start));
        start = slash + 1;
    }
    return levels;
}

} // namespace

bool isValidKeyPattern(const std::string& pattern) {
    if (pattern.empty()) return false;
    
    auto levels = splitLevels(pattern);
    for (size_t i = 0; i < levels.size(); ++i) {
        const auto& level = levels[i];
        if (level.find('#') != std::string::npos && (level != "#" || i != levels.size() - 1)) {
            return false;
        }
        if (level.find('+') != std::string::npos && level != "+") {
            return false;
        }
    }
    return true;
}

bool keyMatchesPattern(const std::string& pattern, const std::string& key) {
    if (!isValidKeyPattern(pattern) || key.empty()) return false;
    
    auto patternLevels = splitLevels(pattern);
    auto keyLevels = splitLevels(key);
    
    size_t i = 0;
    for (; i < patternLevels.size(); ++i) {
        const auto& level = patternLevels[i];
        if (level == "#") {
            return true;
        }
        if (i >= keyLevels.size()) {
            return false;
        }
        if (level != "+" && level != keyLevels[i]) {
            return false;
        }
    }
    return i == keyLevels.size();
}

} // namespace geoshare
