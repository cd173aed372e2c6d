#pragma once

#include <string>

namespace geoshare {

/**
 * @brief Matches a store key against a subscription pattern.
 *
 * Uses MQTT topic-filter syntax so the same pattern works for the in-memory
 * store and the broker: '+' matches exactly one level, '#' (last level only)
 * matches any remaining levels including none.
 */
bool keyMatchesPattern(const std::string& pattern, const std::string& key);

/// False for empty patterns and for '#' used anywhere but as the whole last level.
bool isValidKeyPattern(const std::string& pattern);

} // namespace geoshare
