#pragma once

#include "../ports/ISharedLocationStore.hpp"
#include "../IMqttClient.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace geoshare::adapters {

struct StoreEndpoint {
    std::string host = "localhost";
    std::uint16_t port = 1883;
    std::string clientId;
    std::string username;
    std::string password;
    bool useTls = false;
    TlsConfig tls;
};

/**
 * @brief SharedLocationStore over an MQTT broker.
 *
 * Keys map to topics under an optional prefix. Every write is a retained QoS 1
 * message, so the broker's retained set is the last-value cache and a new
 * subscription receives the current value of every matching key. remove() publishes
 * an empty retained payload, which clears the key and reaches subscribers as an
 * empty value.
 */
class MqttLocationStore : public ports::ISharedLocationStore {
public:
    explicit MqttLocationStore(std::shared_ptr<IMqttClient> mqttClient, std::string topicPrefix = "geoshare/");
    ~MqttLocationStore() override = default;

    bool connect(const StoreEndpoint& endpoint);
    void disconnect();

    bool put(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;
    SubscriptionId onValueChanged(const std::string& keyPattern, ValueHandler handler) override;
    void cancel(SubscriptionId id) override;
    bool isConnected() const override;
    void setConnectionHandler(ConnectionHandler handler) override;
    void processEvents() override;

    std::string topicForKey(const std::string& key) const;
    std::string keyForTopic(const std::string& topic) const;

private:
    struct Subscription {
        std::string pattern;
        ValueHandler handler;
    };

    void onMqttMessage(const MqttMessage& message);
    void onMqttConnection(bool connected, const std::string& reason);

    static constexpr int kQos = 1;

    std::shared_ptr<IMqttClient> mqttClient_;
    std::string topicPrefix_;
    
    std::mutex mutex_;
    std::map<SubscriptionId, Subscription> subscriptions_;
    SubscriptionId nextSubscriptionId_ = 1;
    ConnectionHandler connectionHandler_;
};

} // namespace geoshare::adapters
