/**
 * @file main_cli.cpp
 * @brief Command-line client for location sharing
 *
 * Runs one signed-in user on a simulated device: a scripted route feeds the
 * tracking strategies, presence is exchanged through an MQTT broker (or an
 * in-process store with --offline), and proximity and geofence notifications are
 * printed to the terminal. The sharing choice is kept in a state file, so a client
 * that was sharing when it stopped resumes sharing on the next start.
 *
 * @note All core calls run on the background worker; the input thread only posts tasks
 * @note Supports configuration via TOML files and environment variables
 */

#include "ConsoleNotificationSink.hpp"
#include "FileSharingStateStore.hpp"
#include "PahoMqttClient.hpp"
#include "TomlConfig.hpp"
#include "IClock.hpp"
#include "IRng.hpp"
#include "adapters/DefaultPolicies.hpp"
#include "adapters/MqttLocationStore.hpp"
#include "domain/BackgroundWorker.hpp"
#include "domain/LocationSharingService.hpp"
#include "domain/TaskQueue.hpp"
#include "sim/MockLocationStore.hpp"
#include "sim/SimulatedBattery.hpp"
#include "sim/SimulatedLocationSampler.hpp"
#include "sim/SimulatedPlatform.hpp"
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <signal.h>
#include <thread>
#include <vector>

using namespace geoshare;

/// Global flag for graceful shutdown coordination
static std::atomic<bool> g_running{true};

/**
 * @brief Signal handler for graceful shutdown
 * @param signal Signal number received
 */
void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

/**
 * @brief Display program usage information
 * @param programName Name of the executable (from argv[0])
 */
void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  --config [file]    Configuration file (default: geoshare.toml)\n"
              << "  --user [id]        Override the signed-in user id\n"
              << "  --state [file]     Sharing state file (default: geoshare_state.json)\n"
              << "  --share            Enable sharing on startup\n"
              << "  --watch            Follow peers without sharing, ignoring the saved choice\n"
              << "  --offline          Use an in-process store with a simulated peer\n"
              << "  --headless         Run without user interaction\n"
              << "  --help             Show this help message\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [user]\n"
              << "  id = \"alice\"\n"
              << "  [store]\n"
              << "  host = \"localhost\"\n"
              << "  port = 1883\n"
              << std::endl;
}

namespace {

/// One simulated device: its samplers, its battery and the service that uses them.
struct SimulatedDevice {
    std::shared_ptr<sim::SimulatedLocationSampler> gps;
    std::shared_ptr<sim::SimulatedLocationSampler> fused;
    std::shared_ptr<sim::SimulatedLocationSampler> network;
    std::shared_ptr<sim::SimulatedBattery> battery;
    std::unique_ptr<domain::LocationSharingService> service;

    void tick() {
        gps->tick();
        fused->tick();
        network->tick();
        battery->tick(1.0, service->isSharing());
        service->updatePowerState(battery->powerState());
        service->tick();
    }
};

std::vector<domain::TrackingStrategy> makeStrategies(SimulatedDevice& device) {
    return {
        {"foreground-service", device.gps, domain::StrategyMode::Subscription, ports::PermissionLevel::Foreground},
        {"background-service", device.fused, domain::StrategyMode::Subscription, ports::PermissionLevel::Background},
        {"degraded-fallback", device.network, domain::StrategyMode::Polling, ports::PermissionLevel::Foreground},
    };
}

SimulatedDevice makeDevice(const AppConfig& config,
                           std::vector<GeoPoint> route,
                           std::shared_ptr<ports::ISharedLocationStore> store,
                           std::shared_ptr<ports::IDispatcher> dispatcher,
                           std::shared_ptr<IClock> clock,
                           std::shared_ptr<ports::INotificationSink> notifications,
                           std::shared_ptr<ports::ISharingStateStore> stateStore = nullptr) {
    auto rng = std::make_shared<StandardRng>();
    auto routeDuration = std::chrono::milliseconds(
        static_cast<long long>(config.simulation.routeMinutes * 60000.0));

    SimulatedDevice device;
    device.gps = std::make_shared<sim::SimulatedLocationSampler>("gps", clock, SourceProvider::Gps, 8.0, rng);
    device.fused = std::make_shared<sim::SimulatedLocationSampler>("fused", clock, SourceProvider::Fused, 20.0, rng);
    device.network = std::make_shared<sim::SimulatedLocationSampler>("network", clock, SourceProvider::Network, 150.0, rng);
    for (auto* sampler : {device.gps.get(), device.fused.get(), device.network.get()}) {
        sampler->setRoute(route, routeDuration);
    }
    if (config.simulation.primaryFails) {
        device.gps->setBehavior(sim::SamplerBehavior::FailToStart);
    }

    device.battery = std::make_shared<sim::SimulatedBattery>(rng, config.simulation.batteryPercent);
    device.battery->setCharging(config.simulation.charging);
    device.battery->setPowerSaveMode(config.simulation.powerSave);
    device.battery->setNetwork(config.simulation.network);
    device.battery->setDeviceClass(config.sharing.deviceProfile.deviceClass);

    device.service = std::make_unique<domain::LocationSharingService>(
        config.sharing,
        makeStrategies(device),
        std::move(store),
        std::make_shared<sim::StaticLocationPermissions>(),
        std::make_shared<adapters::DefaultPolicyEngine>(config.sharing.deviceProfile),
        std::move(dispatcher),
        clock,
        std::move(notifications),
        std::make_shared<sim::SimulatedPowerExemption>(),
        std::move(stateStore));
    device.service->updatePowerState(device.battery->powerState());
    return device;
}

void printPeers(const domain::LocationSharingService& service, Timestamp now,
                const std::optional<GeoPoint>& own) {
    auto peers = service.peers();
    if (peers->empty()) {
        std::cout << "No peers" << std::endl;
        return;
    }
    for (const auto& [userId, view] : *peers) {
        std::cout << "  " << userId << ": " << (view.isOnline ? "online" : "offline")
                  << ", " << lastSeenText(view, now);
        if (view.location && own) {
            GeoPoint peerPoint{view.location->lat, view.location->lng};
            std::cout << ", " << Geo::formatDistance(Geo::distanceMeters(*own, peerPoint))
                      << " " << Geo::cardinalDirection(Geo::bearingDegrees(own->lat, own->lng, peerPoint.lat, peerPoint.lng));
        }
        if (view.trackingDegraded) {
            std::cout << " (no recent fix)";
        }
        std::cout << std::endl;
    }
}

NetworkClass nextNetwork(NetworkClass network) {
    switch (network) {
        case NetworkClass::Wifi: return NetworkClass::Cellular;
        case NetworkClass::Cellular: return NetworkClass::None;
        default: return NetworkClass::Wifi;
    }
}

} // namespace

/**
 * @brief Main application entry point
 * @param argc Command line argument count
 * @param argv Command line argument values
 * @return Exit code (0 for success, 1 for error)
 */
int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    bool shareOnStart = false;
    bool resumeOnStart = true;
    bool offline = false;
    bool headless = false;
    std::string userOverride;

    std::string configFile = "geoshare.toml";
    std::string stateFile = "geoshare_state.json";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 < argc) {
                configFile = argv[++i];
            }
        } else if (arg == "--user") {
            if (i + 1 < argc) {
                userOverride = argv[++i];
            }
        } else if (arg == "--state") {
            if (i + 1 < argc) {
                stateFile = argv[++i];
            }
        } else if (arg == "--share") {
            shareOnStart = true;
        } else if (arg == "--watch") {
            shareOnStart = false;
            resumeOnStart = false;
        } else if (arg == "--offline") {
            offline = true;
        } else if (arg == "--headless") {
            headless = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    auto config = TomlConfig::loadFromFile(configFile);
    if (!userOverride.empty()) {
        config.sharing.userId = userOverride;
        config.store.clientId = "geoshare-" + userOverride;
    }

    std::string error;
    if (!config.validate(error)) {
        std::cerr << "Error: invalid configuration in " << configFile << ": " << error << std::endl;
        return 1;
    }

    std::cout << "Starting geoshare client" << std::endl;
    std::cout << "User: " << config.sharing.userId << std::endl;
    std::cout << "Device profile: " << config.sharing.deviceProfile.manufacturer
              << (config.sharing.deviceProfile.requestExemption ? " (aggressive power management)" : "")
              << std::endl;

    auto clock = std::make_shared<SystemClock>();
    auto queue = std::make_shared<domain::TaskQueue>();
    auto notifications = std::make_shared<ConsoleNotificationSink>();

    std::shared_ptr<ports::ISharedLocationStore> store;
    std::shared_ptr<adapters::MqttLocationStore> mqttStore;
    if (offline) {
        std::cout << "Store: in-process (offline)" << std::endl;
        store = std::make_shared<sim::MockLocationStore>();
    } else {
        std::cout << "Store: " << (config.store.useTls ? "mqtts://" : "mqtt://")
                  << config.store.host << ":" << config.store.port << std::endl;
        mqttStore = std::make_shared<adapters::MqttLocationStore>(std::make_shared<PahoMqttClient>(),
                                                                  config.topicPrefix);
        if (!mqttStore->connect(config.store)) {
            std::cerr << "Error: could not start connecting to the broker" << std::endl;
            return 1;
        }
        store = mqttStore;
    }

    std::optional<SimulatedDevice> device;
    std::optional<SimulatedDevice> buddy;
    try {
        auto stateStore = std::make_shared<FileSharingStateStore>(stateFile);
        std::cout << "Sharing state: " << stateStore->path() << std::endl;
        device = makeDevice(config, config.simulation.route, store, queue, clock, notifications, stateStore);

        if (offline) {
            // A second user walking the route the other way, so the demo has someone to meet
            AppConfig buddyConfig = config;
            buddyConfig.sharing.userId = config.sharing.userId == "buddy" ? "buddy-2" : "buddy";
            buddyConfig.sharing.geofences.clear();
            buddyConfig.simulation.primaryFails = false;
            std::vector<GeoPoint> reversed(config.simulation.route.rbegin(), config.simulation.route.rend());
            buddy = makeDevice(buddyConfig, reversed, store, queue, clock, nullptr);
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    device->service->setPeerViewHandler([clock](const PeerPresenceView& view) {
        std::cout << "[Peers] " << view.userId << " " << lastSeenText(view, clock->now()) << std::endl;
    });

    queue->post([&]() {
        auto result = device->service->start();
        if (!result) {
            std::cerr << "Error: " << result.message << std::endl;
            g_running = false;
            return;
        }
        auto shared = TrackingResult::success();
        if (shareOnStart) {
            shared = device->service->enableSharing();
        } else if (resumeOnStart) {
            shared = device->service->resumeIfEnabled();
        }
        if (!shared) {
            std::cout << "Sharing not enabled: " << trackingErrorToString(shared.error)
                      << " " << shared.message << std::endl;
        }
        if (buddy) {
            buddy->service->enableSharing();
        }
    });

    domain::BackgroundWorker worker(queue, std::chrono::seconds(1));
    worker.start([&]() {
        device->tick();
        if (buddy) {
            buddy->tick();
        }
    });

    std::thread inputThread;
    if (!headless) {
        std::cout << "\nInteractive mode. Commands:" << std::endl;
        std::cout << "  s - Toggle sharing" << std::endl;
        std::cout << "  b - Set battery percentage" << std::endl;
        std::cout << "  c - Toggle charging" << std::endl;
        std::cout << "  n - Cycle network (wifi, cellular, none)" << std::endl;
        std::cout << "  f - Toggle primary strategy failure" << std::endl;
        std::cout << "  p - Show peers" << std::endl;
        std::cout << "  o - Sign out" << std::endl;
        std::cout << "  q - Quit" << std::endl;

        inputThread = std::thread([&]() {
            char cmd;
            while (g_running && std::cin >> cmd) {
                switch (cmd) {
                    case 's':
                        queue->post([&]() {
                            if (device->service->isSharing()) {
                                device->service->disableSharing();
                            } else {
                                auto result = device->service->enableSharing();
                                if (!result) {
                                    std::cout << "Sharing not enabled: " << trackingErrorToString(result.error)
                                              << " " << result.message << std::endl;
                                }
                            }
                        });
                        break;

                    case 'b': {
                        double battery;
                        std::cout << "Enter battery percentage: ";
                        if (!(std::cin >> battery)) {
                            g_running = false;
                            break;
                        }
                        queue->post([&, battery]() {
                            device->battery->setPercentage(battery);
                            std::cout << "Battery set to " << battery << "%" << std::endl;
                        });
                        break;
                    }

                    case 'c':
                        queue->post([&]() {
                            device->battery->setCharging(!device->battery->isCharging());
                            std::cout << "Charging " << (device->battery->isCharging() ? "ON" : "OFF") << std::endl;
                        });
                        break;

                    case 'n':
                        queue->post([&]() {
                            device->battery->setNetwork(nextNetwork(device->battery->network()));
                            std::cout << "Network " << networkClassToString(device->battery->network()) << std::endl;
                        });
                        break;

                    case 'f':
                        queue->post([&]() {
                            bool failing = device->gps->behavior() == sim::SamplerBehavior::Healthy;
                            device->gps->setBehavior(failing ? sim::SamplerBehavior::Silent
                                                             : sim::SamplerBehavior::Healthy);
                            std::cout << "GPS " << sim::samplerBehaviorToString(device->gps->behavior()) << std::endl;
                        });
                        break;

                    case 'p':
                        queue->post([&]() {
                            std::optional<GeoPoint> own;
                            if (device->service->isSharing()) {
                                own = device->gps->position();
                            }
                            printPeers(*device->service, clock->now(), own);
                        });
                        break;

                    case 'o':
                        queue->post([&]() {
                            device->service->signOut();
                        });
                        break;

                    case 'q':
                        g_running = false;
                        break;

                    default:
                        std::cout << "Unknown command" << std::endl;
                        break;
                }
            }
            g_running = false;
        });
    } else {
        std::cout << "Running in headless mode. Press Ctrl+C to stop." << std::endl;
    }

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\nStopping..." << std::endl;
    queue->post([&]() {
        // Shutting down is not a choice to stop sharing
        device->service->suspendSharing();
        device->service->stop();
        if (buddy) {
            buddy->service->signOut();
        }
    });
    worker.stop();

    if (mqttStore) {
        // Let queued clears reach the broker before disconnecting
        std::this_thread::sleep_for(std::chrono::seconds(1));
        mqttStore->processEvents();
        mqttStore->disconnect();
    }

    if (inputThread.joinable()) {
        // Blocked on stdin until the user presses enter
        std::cout << "Press enter to exit" << std::endl;
        inputThread.join();
    }

    std::cout << "Client stopped." << std::endl;
    return 0;
}
