#include "MqttLocationStore.hpp"
#include "../KeyPattern.hpp"
#include <iostream>
#include <stdexcept>
#include <vector>

namespace geoshare::adapters {

MqttLocationStore::MqttLocationStore(std::shared_ptr<IMqttClient> mqttClient, std::string topicPrefix)
    : mqttClient_(std::move(mqttClient)), topicPrefix_(std::move(topicPrefix)) {
    if (!mqttClient_) {
        throw std::invalid_argument("MqttLocationStore requires an MQTT client");
    }
    if (topicPrefix_.find_first_of("+#") != std::string::npos) {
        throw std::invalid_argument("Topic prefix must not contain wildcards: " + topicPrefix_);
    }
    
    mqttClient_->setMessageCallback([this](const MqttMessage& msg) {
        onMqttMessage(msg);
    });
    
    mqttClient_->setConnectionCallback([this](bool connected, const std::string& reason) {
        onMqttConnection(connected, reason);
    });
}

bool MqttLocationStore::connect(const StoreEndpoint& endpoint) {
    if (endpoint.useTls) {
        return mqttClient_->connectWithTls(endpoint.host, endpoint.port, endpoint.clientId,
                                           endpoint.username, endpoint.password, endpoint.tls);
    }
    return mqttClient_->connect(endpoint.host, endpoint.port, endpoint.clientId,
                                endpoint.username, endpoint.password);
}

void MqttLocationStore::disconnect() {
    mqttClient_->disconnect();
}

bool MqttLocationStore::put(const std::string& key, const std::string& value) {
    if (value.empty()) {
        std::cerr << "[MqttStore] Refusing empty value for " << key << ", use remove()" << std::endl;
        return false;
    }
    return mqttClient_->publish(topicForKey(key), value, kQos, true);
}

bool MqttLocationStore::remove(const std::string& key) {
    return mqttClient_->publish(topicForKey(key), "", kQos, true);
}

ports::ISharedLocationStore::SubscriptionId MqttLocationStore::onValueChanged(const std::string& keyPattern,
                                                                              ValueHandler handler) {
    if (!isValidKeyPattern(keyPattern) || !handler) {
        std::cerr << "[MqttStore] Invalid subscription pattern: " << keyPattern << std::endl;
        return kInvalidSubscription;
    }
    
    SubscriptionId id;
    bool firstForPattern = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [existingId, subscription] : subscriptions_) {
            if (subscription.pattern == keyPattern) {
                firstForPattern = false;
                break;
            }
        }
        id = nextSubscriptionId_++;
        subscriptions_[id] = Subscription{keyPattern, std::move(handler)};
    }
    
    if (firstForPattern && !mqttClient_->subscribe(topicForKey(keyPattern), kQos)) {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriptions_.erase(id);
        return kInvalidSubscription;
    }
    
    std::cout << "[MqttStore] Watching " << topicForKey(keyPattern) << std::endl;
    return id;
}

void MqttLocationStore::cancel(SubscriptionId id) {
    std::string pattern;
    bool lastForPattern = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscriptions_.find(id);
        if (it == subscriptions_.end()) return;
        
        pattern = it->second.pattern;
        subscriptions_.erase(it);
        for (const auto& [otherId, subscription] : subscriptions_) {
            if (subscription.pattern == pattern) {
                lastForPattern = false;
                break;
            }
        }
    }
    
    if (lastForPattern && !mqttClient_->unsubscribe(topicForKey(pattern))) {
        std::cerr << "[MqttStore] Unsubscribe from " << topicForKey(pattern) << " failed" << std::endl;
    }
}

bool MqttLocationStore::isConnected() const {
    return mqttClient_->isConnected();
}

void MqttLocationStore::setConnectionHandler(ConnectionHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    connectionHandler_ = std::move(handler);
}

void MqttLocationStore::processEvents() {
    mqttClient_->processEvents();
}

std::string MqttLocationStore::topicForKey(const std::string& key) const {
    return topicPrefix_ + key;
}

std::string MqttLocationStore::keyForTopic(const std::string& topic) const {
    if (topic.compare(0, topicPrefix_.size(), topicPrefix_) != 0) {
        return "";
    }
    return topic.substr(topicPrefix_.size());
}

void MqttLocationStore::onMqttMessage(const MqttMessage& message) {
    auto key = keyForTopic(message.topic);
    if (key.empty()) return;
    
    std::optional<std::string> value;
    if (!message.payload.empty()) {
        value = message.payload;
    }
    
    std::vector<ValueHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, subscription] : subscriptions_) {
            if (keyMatchesPattern(subscription.pattern, key)) {
                handlers.push_back(subscription.handler);
            }
        }
    }
    
    for (const auto& handler : handlers) {
        handler(key, value);
    }
}

void MqttLocationStore::onMqttConnection(bool connected, const std::string& reason) {
    std::cout << "[MqttStore] " << (connected ? "Connected" : "Disconnected") << ": " << reason << std::endl;
    
    ConnectionHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = connectionHandler_;
    }
    if (handler) {
        handler(connected, reason);
    }
}

} // namespace geoshare::adapters
