/**
 * @file TomlConfig.hpp
 * @brief TOML configuration file parser for the desktop location sharing client
 *
 * Provides a simple line-based TOML parser for the client settings: who the user
 * is, where the shared store lives, and the tunables of tracking, presence and
 * proximity. Environment variables override file values so the same file can be
 * reused for several simulated users.
 *
 * Supported Sections:
 * - [user]: Signed-in user identity
 * - [store]: MQTT broker endpoint, credentials and topic prefix
 * - [tracking]: Strategy failover timings
 * - [presence]: Heartbeat, staleness and sweep intervals
 * - [proximity]: Proximity threshold and cooldown
 * - [device]: Manufacturer and initial power state
 * - [simulation]: Simulated route and movement
 * - [[geofences]]: Geofence definitions, one table per region
 *
 * @note Unknown keys are ignored, malformed numbers keep their defaults
 */

#pragma once

#include "adapters/DevicePowerProfiles.hpp"
#include "adapters/MqttLocationStore.hpp"
#include "domain/LocationSharingService.hpp"
#include "Geo.hpp"
#include "Sampling.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace geoshare {

/**
 * @brief Simulated movement for the demo client
 */
struct SimulationConfig {
    std::vector<GeoPoint> route;            ///< Waypoints travelled in order
    double routeMinutes = 20.0;             ///< Time to travel the whole route
    double batteryPercent = 100.0;          ///< Initial battery level
    bool charging = false;
    bool powerSave = false;
    NetworkClass network = NetworkClass::Wifi;
    bool primaryFails = false;              ///< Make the first strategy fail to start
};

/**
 * @brief Complete desktop client configuration
 */
struct AppConfig {
    domain::SharingConfig sharing;          ///< Core service configuration
    adapters::StoreEndpoint store;          ///< Broker connection parameters
    std::string topicPrefix = "geoshare/";  ///< Prefix prepended to every store key
    std::string manufacturer = "generic";   ///< Used to select the device power profile
    SimulationConfig simulation;

    /**
     * @brief Check the minimum settings needed to run
     * @param error Receives a description of the first problem found
     * @return true when the configuration can be used
     */
    bool validate(std::string& error) const {
        if (sharing.userId.empty()) {
            error = "missing [user] id";
            return false;
        }
        if (store.host.empty()) {
            error = "missing [store] host";
            return false;
        }
        if (sharing.presence.stalenessThreshold <= 2 * sharing.presence.heartbeatInterval) {
            error = "[presence] staleness_sec must exceed twice heartbeat_sec";
            return false;
        }
        return true;
    }
};

/**
 * @brief TOML configuration file parser
 *
 * Parses the client configuration file and applies environment overrides.
 * All methods are static and hold no state between calls.
 */
class TomlConfig {
public:
    /**
     * @brief Safe environment variable getter
     * @param name Environment variable name
     * @return Environment variable value or empty string if not set
     */
    static std::string safeGetEnv(const char* name) {
#ifdef _WIN32
        char* buffer = nullptr;
        size_t size = 0;
        if (_dupenv_s(&buffer, &size, name) == 0 && buffer != nullptr) {
            std::string result(buffer);
            free(buffer);
            return result;
        }
        return "";
#else
        const char* value = std::getenv(name);
        return value ? std::string(value) : "";
#endif
    }

    /**
     * @brief Configuration with built-in defaults only
     *
     * Includes a short route and two geofences so the client is usable without
     * a configuration file.
     */
    static AppConfig defaults() {
        AppConfig config;
        config.sharing.deviceProfile = adapters::lookupDevicePowerProfile(config.manufacturer);

        config.simulation.route = {
            {-26.2041, 28.0473},
            {-26.2000, 28.0500},
            {-26.1950, 28.0520},
            {-26.1920, 28.0480},
        };

        config.sharing.geofences = {
            {"office", {-26.2041, 28.0473}, 100.0, "Office"},
            {"home", {-26.1920, 28.0480}, 150.0, "Home"},
        };

        return config;
    }

    /**
     * @brief Load and parse TOML configuration file
     * @param filename Path to TOML configuration file
     * @return Configuration with file values and environment overrides applied
     * @note A missing file is reported and the defaults are returned
     * @note A file that defines [[route]] or [[geofences]] replaces the default lists
     */
    static AppConfig loadFromFile(const std::string& filename) {
        AppConfig config = defaults();
        std::ifstream file(filename);

        if (!file.is_open()) {
            std::cerr << "[Config] Could not open config file: " << filename << ", using defaults" << std::endl;
            applyEnvironment(config);
            return config;
        }

        bool customRoute = false;
        bool customGeofences = false;

        std::string currentSection;
        std::string line;
        while (std::getline(file, line)) {
            stripComment(line);
            trim(line);

            if (line.empty()) {
                continue;
            }

            // Array tables
            if (line.rfind("[[", 0) == 0) {
                if (line.size() > 4 && line.compare(line.size() - 2, 2, "]]") == 0) {
                    currentSection = line.substr(2, line.length() - 4);
                    trim(currentSection);
                    if (currentSection == "geofences") {
                        if (!customGeofences) {
                            config.sharing.geofences.clear();
                            customGeofences = true;
                        }
                        config.sharing.geofences.emplace_back();
                    } else if (currentSection == "route") {
                        if (!customRoute) {
                            config.simulation.route.clear();
                            customRoute = true;
                        }
                        config.simulation.route.emplace_back();
                    }
                }
                continue;
            }

            if (line[0] == '[') {
                if (line.back() == ']') {
                    currentSection = line.substr(1, line.length() - 2);
                    trim(currentSection);
                }
                continue;
            }

            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                continue;
            }

            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);
            unquote(value);

            applyValue(config, currentSection, key, value);
        }

        // Drop geofence tables that never got a usable radius or id
        auto& fences = config.sharing.geofences;
        for (auto it = fences.begin(); it != fences.end();) {
            if (it->id.empty() || !(it->radiusMeters > 0.0)) {
                std::cerr << "[Config] Ignoring incomplete geofence '" << it->id << "'" << std::endl;
                it = fences.erase(it);
            } else {
                ++it;
            }
        }

        config.sharing.deviceProfile = adapters::lookupDevicePowerProfile(config.manufacturer);

        applyEnvironment(config);

        if (config.store.useTls) {
            validateCertificatePaths(config);
        }

        return config;
    }

    /**
     * @brief Apply GEOSHARE_* environment overrides
     * @param config Configuration modified in place
     */
    static void applyEnvironment(AppConfig& config) {
        std::string userId = safeGetEnv("GEOSHARE_USER_ID");
        std::string host = safeGetEnv("GEOSHARE_STORE_HOST");
        std::string port = safeGetEnv("GEOSHARE_STORE_PORT");
        std::string username = safeGetEnv("GEOSHARE_STORE_USERNAME");
        std::string password = safeGetEnv("GEOSHARE_STORE_PASSWORD");
        std::string heartbeat = safeGetEnv("GEOSHARE_HEARTBEAT_SEC");
        std::string staleness = safeGetEnv("GEOSHARE_STALENESS_SEC");
        std::string manufacturer = safeGetEnv("GEOSHARE_MANUFACTURER");

        if (!userId.empty()) config.sharing.userId = userId;
        if (!host.empty()) config.store.host = host;
        if (!port.empty()) readPort(port, "GEOSHARE_STORE_PORT", config.store.port);
        if (!username.empty()) config.store.username = username;
        if (!password.empty()) config.store.password = password;
        if (!heartbeat.empty()) readSeconds(heartbeat, "GEOSHARE_HEARTBEAT_SEC", config.sharing.presence.heartbeatInterval);
        if (!staleness.empty()) readSeconds(staleness, "GEOSHARE_STALENESS_SEC", config.sharing.presence.stalenessThreshold);
        if (!manufacturer.empty()) {
            config.manufacturer = manufacturer;
            config.sharing.deviceProfile = adapters::lookupDevicePowerProfile(manufacturer);
        }

        if (config.store.clientId.empty() && !config.sharing.userId.empty()) {
            config.store.clientId = "geoshare-" + config.sharing.userId;
        }
    }

private:
    static void applyValue(AppConfig& config, const std::string& section,
                           const std::string& key, const std::string& value) {
        auto& sharing = config.sharing;

        if (section == "user") {
            if (key == "id") {
                sharing.userId = value;
            }
        } else if (section == "store") {
            if (key == "host") {
                config.store.host = value;
            } else if (key == "port") {
                readPort(value, key, config.store.port);
            } else if (key == "client_id") {
                config.store.clientId = value;
            } else if (key == "username") {
                config.store.username = value;
            } else if (key == "password") {
                config.store.password = value;
            } else if (key == "tls") {
                config.store.useTls = parseBool(value);
            } else if (key == "ca") {
                config.store.tls.caPath = value;
            } else if (key == "cert") {
                config.store.tls.certPath = value;
            } else if (key == "key") {
                config.store.tls.keyPath = value;
            } else if (key == "verify_server_cert") {
                config.store.tls.verifyServer = parseBool(value);
            } else if (key == "prefix") {
                config.topicPrefix = value;
            }
        } else if (section == "tracking") {
            if (key == "startup_timeout_sec") {
                readSeconds(value, key, sharing.tracking.startupTimeout);
            } else if (key == "health_check_sec") {
                readSeconds(value, key, sharing.tracking.healthCheckInterval);
            } else if (key == "backoff_min") {
                double minutes = 0.0;
                if (readDouble(value, key, minutes) && minutes > 0.0) {
                    sharing.tracking.failedStrategyBackoff =
                        std::chrono::milliseconds(static_cast<long long>(minutes * 60000.0));
                }
            } else if (key == "max_timeouts") {
                int count = 0;
                if (readInt(value, key, count) && count > 0) {
                    sharing.tracking.maxConsecutiveTimeouts = count;
                }
            }
        } else if (section == "presence") {
            if (key == "heartbeat_sec") {
                readSeconds(value, key, sharing.presence.heartbeatInterval);
            } else if (key == "staleness_sec") {
                readSeconds(value, key, sharing.presence.stalenessThreshold);
            } else if (key == "sweep_sec") {
                readSeconds(value, key, sharing.presence.sweepInterval);
            }
        } else if (section == "proximity") {
            if (key == "threshold_m") {
                double meters = 0.0;
                if (readDouble(value, key, meters) && meters > 0.0) {
                    sharing.proximity.thresholdMeters = meters;
                }
            } else if (key == "cooldown_min") {
                double minutes = 0.0;
                if (readDouble(value, key, minutes) && minutes >= 0.0) {
                    sharing.proximity.cooldown =
                        std::chrono::milliseconds(static_cast<long long>(minutes * 60000.0));
                }
            }
        } else if (section == "device") {
            if (key == "manufacturer") {
                config.manufacturer = value;
            } else if (key == "battery") {
                readDouble(value, key, config.simulation.batteryPercent);
            } else if (key == "charging") {
                config.simulation.charging = parseBool(value);
            } else if (key == "power_save") {
                config.simulation.powerSave = parseBool(value);
            } else if (key == "network") {
                config.simulation.network = stringToNetworkClass(value);
            }
        } else if (section == "simulation") {
            if (key == "route_minutes") {
                double minutes = 0.0;
                if (readDouble(value, key, minutes) && minutes > 0.0) {
                    config.simulation.routeMinutes = minutes;
                }
            } else if (key == "primary_fails") {
                config.simulation.primaryFails = parseBool(value);
            }
        } else if (section == "route" && !config.simulation.route.empty()) {
            auto& point = config.simulation.route.back();
            if (key == "lat") {
                readDouble(value, key, point.lat);
            } else if (key == "lng") {
                readDouble(value, key, point.lng);
            }
        } else if (section == "geofences" && !sharing.geofences.empty()) {
            auto& region = sharing.geofences.back();
            if (key == "id") {
                region.id = value;
                if (region.label.empty()) region.label = value;
            } else if (key == "label") {
                region.label = value;
            } else if (key == "lat") {
                readDouble(value, key, region.center.lat);
            } else if (key == "lng") {
                readDouble(value, key, region.center.lng);
            } else if (key == "radius_m") {
                readDouble(value, key, region.radiusMeters);
            }
        }
    }

    /**
     * @brief Validate TLS file paths exist
     * @param config Configuration to validate
     * @note Only warns; the MQTT client refuses to connect with missing files
     */
    static void validateCertificatePaths(const AppConfig& config) {
        namespace fs = std::filesystem;
        const auto& tls = config.store.tls;

        if (!tls.caPath.empty() && !fs::exists(tls.caPath)) {
            std::cerr << "[Config] Warning: CA certificate not found: " << tls.caPath << std::endl;
        }
        if (!tls.certPath.empty() && !fs::exists(tls.certPath)) {
            std::cerr << "[Config] Warning: Client certificate not found: " << tls.certPath << std::endl;
        }
        if (!tls.keyPath.empty() && !fs::exists(tls.keyPath)) {
            std::cerr << "[Config] Warning: Client private key not found: " << tls.keyPath << std::endl;
        }
    }

    static bool readInt(const std::string& value, const std::string& key, int& out) {
        try {
            size_t consumed = 0;
            int parsed = std::stoi(value, &consumed);
            if (consumed != value.size()) {
                throw std::invalid_argument("trailing characters");
            }
            out = parsed;
            return true;
        } catch (const std::exception& e) {
            std::cerr << "[Config] Invalid integer for " << key << ": '" << value << "' (" << e.what() << ")" << std::endl;
            return false;
        }
    }

    static bool readDouble(const std::string& value, const std::string& key, double& out) {
        try {
            size_t consumed = 0;
            double parsed = std::stod(value, &consumed);
            if (consumed != value.size()) {
                throw std::invalid_argument("trailing characters");
            }
            out = parsed;
            return true;
        } catch (const std::exception& e) {
            std::cerr << "[Config] Invalid number for " << key << ": '" << value << "' (" << e.what() << ")" << std::endl;
            return false;
        }
    }

    static void readSeconds(const std::string& value, const std::string& key, std::chrono::milliseconds& out) {
        double seconds = 0.0;
        if (!readDouble(value, key, seconds)) {
            return;
        }
        if (!(seconds > 0.0)) {
            std::cerr << "[Config] " << key << " must be positive, keeping default" << std::endl;
            return;
        }
        out = std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
    }

    static void readPort(const std::string& value, const std::string& key, std::uint16_t& out) {
        int port = 0;
        if (!readInt(value, key, port)) {
            return;
        }
        if (port <= 0 || port > 65535) {
            std::cerr << "[Config] Port out of range: " << port << std::endl;
            return;
        }
        out = static_cast<std::uint16_t>(port);
    }

    static bool parseBool(const std::string& value) {
        return value == "true" || value == "1" || value == "yes";
    }

    /**
     * @brief Remove a trailing comment, ignoring '#' inside quoted strings
     * @param line Line to modify in place
     */
    static void stripComment(std::string& line) {
        bool quoted = false;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') {
                quoted = !quoted;
            } else if (line[i] == '#' && !quoted) {
                line.erase(i);
                return;
            }
        }
    }

    /**
     * @brief Trim whitespace from both ends of string
     * @param str String to trim (modified in place)
     */
    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }

    /**
     * @brief Remove surrounding quotes from string value
     * @param value String value to unquote (modified in place)
     */
    static void unquote(std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
};

} // namespace geoshare
