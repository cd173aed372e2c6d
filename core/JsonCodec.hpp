#pragma once

#include "Presence.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace geoshare {

/**
 * @brief Wire codec for presence/{userId} records.
 *
 * Location fields are omitted entirely when sharing is disabled; a reader must
 * never see a field that looks present but has been withdrawn.
 */
class JsonCodec {
public:
    static std::string serialize(const PublishedPresence& presence);
    
    /// Throws nlohmann::json::exception or std::invalid_argument on malformed input.
    static PublishedPresence deserialize(const std::string& userId, const std::string& json);
    
    /// Non-throwing variant used by the subscriber loop.
    static std::optional<PublishedPresence> tryDeserialize(const std::string& userId,
                                                           const std::string& json,
                                                           std::string* error = nullptr);
    
    static nlohmann::json presenceToJson(const PublishedPresence& presence);
    static PublishedPresence jsonToPresence(const std::string& userId, const nlohmann::json& json);
};

} // namespace geoshare
