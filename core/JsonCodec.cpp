#include "JsonCodec.hpp"
#include <stdexcept>

namespace geoshare {

namespace {

double requireCoordinate(const nlohmann::json& json, const char* key, double limit) {
    const auto& value = json.at(key);
    if (!value.is_number()) {
        throw std::invalid_argument(std::string("field '") + key + "' is not a number");
    }
    double coordinate = value.get<double>();
    if (!(coordinate >= -limit && coordinate <= limit)) {
        throw std::invalid_argument(std::string("field '") + key + "' out of range");
    }
    return coordinate;
}

} // namespace

std::string JsonCodec::serialize(const PublishedPresence& presence) {
    return presenceToJson(presence).dump();
}

PublishedPresence JsonCodec::deserialize(const std::string& userId, const std::string& json) {
    return jsonToPresence(userId, nlohmann::json::parse(json));
}

std::optional<PublishedPresence> JsonCodec::tryDeserialize(const std::string& userId,
                                                           const std::string& json,
                                                           std::string* error) {
    try {
        return deserialize(userId, json);
    } catch (const nlohmann::json::exception& e) {
        if (error) *error = e.what();
    } catch (const std::invalid_argument& e) {
        if (error) *error = e.what();
    }
    return std::nullopt;
}

nlohmann::json JsonCodec::presenceToJson(const PublishedPresence& presence) {
    nlohmann::json j;
    
    j["userId"] = presence.userId;
    j["sharingEnabled"] = presence.isSharingEnabled;
    j["lastHeartbeatEpochMs"] = toEpochMs(presence.lastHeartbeatAt);
    j["status"] = presenceStatusToString(presence.status);
    j["rev"] = presence.revision;
    
    if (presence.isSharingEnabled && presence.lastSample) {
        const auto& sample = *presence.lastSample;
        j["lat"] = sample.lat;
        j["lng"] = sample.lng;
        j["accuracy"] = sample.accuracyMeters;
        j["capturedAtEpochMs"] = toEpochMs(sample.capturedAt);
        j["source"] = sourceProviderToString(sample.source);
    }
    
    return j;
}

PublishedPresence JsonCodec::jsonToPresence(const std::string& userId, const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument("presence payload is not an object");
    }
    
    PublishedPresence presence;
    presence.userId = userId;
    
    const auto& sharing = json.at("sharingEnabled");
    if (!sharing.is_boolean()) {
        throw std::invalid_argument("field 'sharingEnabled' is not a boolean");
    }
    presence.isSharingEnabled = sharing.get<bool>();
    
    const auto& heartbeat = json.at("lastHeartbeatEpochMs");
    if (!heartbeat.is_number_integer()) {
        throw std::invalid_argument("field 'lastHeartbeatEpochMs' is not an integer");
    }
    presence.lastHeartbeatAt = fromEpochMs(heartbeat.get<int64_t>());
    
    presence.status = stringToPresenceStatus(json.value("status", "ok"));
    
    if (json.contains("rev")) {
        if (!json["rev"].is_number_unsigned()) {
            throw std::invalid_argument("field 'rev' is not an unsigned integer");
        }
        presence.revision = json["rev"].get<uint64_t>();
    }
    
    bool hasLat = json.contains("lat");
    bool hasLng = json.contains("lng");
    if (hasLat != hasLng) {
        throw std::invalid_argument("partial location: lat and lng must be present together");
    }
    
    // A withdrawn location is never surfaced, even if a stale writer left it behind.
    if (hasLat && presence.isSharingEnabled) {
        LocationSample sample;
        sample.lat = requireCoordinate(json, "lat", 90.0);
        sample.lng = requireCoordinate(json, "lng", 180.0);
        sample.accuracyMeters = json.value("accuracy", 0.0);
        sample.capturedAt = fromEpochMs(json.value("capturedAtEpochMs", toEpochMs(presence.lastHeartbeatAt)));
        sample.source = stringToSourceProvider(json.value("source", "unknown"));
        presence.lastSample = sample;
    }
    
    return presence;
}

} // namespace geoshare
