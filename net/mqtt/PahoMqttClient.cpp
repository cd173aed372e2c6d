#include "PahoMqttClient.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>

namespace geoshare {

PahoMqttClient::PahoMqttClient() = default;

PahoMqttClient::~PahoMqttClient() {
    disconnect();
    if (client_) {
        MQTTAsync_destroy(&client_);
    }
}

bool PahoMqttClient::connect(const std::string& host, std::uint16_t port, 
                            const std::string& clientId,
                            const std::string& username, 
                            const std::string& password) {
    std::cout << "[MQTT] Connecting to " << host << ":" << port << " as " << clientId << std::endl;
    
    std::string serverURI = "tcp://" + host + ":" + std::to_string(port);
    return startConnection(serverURI, clientId, username, password, nullptr);
}

bool PahoMqttClient::connectWithTls(const std::string& host, std::uint16_t port,
                                   const std::string& clientId,
                                   const std::string& username,
                                   const std::string& password,
                                   const TlsConfig& tlsConfig) {
    std::cout << "[MQTT] Connecting with TLS to " << host << ":" << port << " as " << clientId << std::endl;
    
    // Validate certificate files before attempting connection
    if (!validateCertificateFiles(tlsConfig)) {
        return false;
    }
    
    std::string serverURI = "ssl://" + host + ":" + std::to_string(port);
    return startConnection(serverURI, clientId, username, password, &tlsConfig);
}

bool PahoMqttClient::startConnection(const std::string& serverURI, const std::string& clientId,
                                     const std::string& username, const std::string& password,
                                     const TlsConfig* tlsConfig) {
    if (client_) {
        disconnect();
        MQTTAsync_destroy(&client_);
        client_ = nullptr;
    }
    
    username_ = username;
    password_ = password;
    if (tlsConfig) {
        tlsConfig_ = *tlsConfig;
    }
    
    int rc = MQTTAsync_create(&client_, serverURI.c_str(), clientId.c_str(), 
                             MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Failed to create client, error code: " << rc << std::endl;
        client_ = nullptr;
        return false;
    }
    
    MQTTAsync_setCallbacks(client_, this, connectionLost, messageArrived, nullptr);
    MQTTAsync_setConnected(client_, this, onConnected);
    
    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
    MQTTAsync_SSLOptions ssl_opts = MQTTAsync_SSLOptions_initializer;
    
    conn_opts.keepAliveInterval = kKeepAliveIntervalSeconds;
    conn_opts.cleansession = 1;
    conn_opts.connectTimeout = kConnectionTimeoutSeconds;
    conn_opts.retryInterval = 5;        // 5 seconds between retries
    conn_opts.automaticReconnect = 1;
    conn_opts.minRetryInterval = kMinRetryIntervalSeconds;
    conn_opts.maxRetryInterval = kMaxRetryIntervalSeconds;
    conn_opts.onFailure = onConnectFailure;
    conn_opts.context = this;
    conn_opts.username = username_.empty() ? nullptr : username_.c_str();
    conn_opts.password = password_.empty() ? nullptr : password_.c_str();
    
    if (tlsConfig) {
        ssl_opts.trustStore = tlsConfig_.caPath.empty() ? nullptr : tlsConfig_.caPath.c_str();
        ssl_opts.keyStore = tlsConfig_.certPath.empty() ? nullptr : tlsConfig_.certPath.c_str();
        ssl_opts.privateKey = tlsConfig_.keyPath.empty() ? nullptr : tlsConfig_.keyPath.c_str();
        ssl_opts.enableServerCertAuth = tlsConfig_.verifyServer ? 1 : 0;
        ssl_opts.verify = tlsConfig_.verifyServer ? 1 : 0;
        ssl_opts.enabledCipherSuites = nullptr;  // Use default cipher suites
        ssl_opts.sslVersion = MQTT_SSL_VERSION_TLS_1_2;
        conn_opts.ssl = &ssl_opts;
    }
    
    rc = MQTTAsync_connect(client_, &conn_opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Connection attempt failed, error code: " << rc << std::endl;
        return false;
    }
    
    std::cout << "[MQTT] Connection attempt initiated" << std::endl;
    return true;
}

void PahoMqttClient::disconnect() {
    if (client_ && connected_.load()) {
        MQTTAsync_disconnectOptions disc_opts = MQTTAsync_disconnectOptions_initializer;
        disc_opts.onSuccess = onDisconnected;
        disc_opts.context = this;
        
        int rc = MQTTAsync_disconnect(client_, &disc_opts);
        if (rc != MQTTASYNC_SUCCESS) {
            std::cerr << "[MQTT] Disconnect failed, error code: " << rc << std::endl;
        }
    }
    connected_.store(false);
}

bool PahoMqttClient::isConnected() const {
    return connected_.load();
}

bool PahoMqttClient::publish(const std::string& topic, const std::string& payload, 
                           int qos, bool retained) {
    MqttMessage message;
    message.topic = topic;
    message.payload = payload;
    message.qos = qos;
    message.retained = retained;
    
    if (!connected_.load()) {
        queueMessage(message);
        return false;
    }
    
    return sendMessage(message);
}

bool PahoMqttClient::subscribe(const std::string& topic, int qos) {
    {
        std::lock_guard<std::mutex> lock(subscriptionMutex_);
        auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                               [&](const auto& s) { return s.first == topic; });
        if (it == subscriptions_.end()) {
            subscriptions_.emplace_back(topic, qos);
        } else {
            it->second = qos;
        }
    }
    
    // Sent on the next (re)connect otherwise
    if (!connected_.load()) {
        return true;
    }
    return sendSubscribe(topic, qos);
}

bool PahoMqttClient::unsubscribe(const std::string& topic) {
    {
        std::lock_guard<std::mutex> lock(subscriptionMutex_);
        subscriptions_.erase(std::remove_if(subscriptions_.begin(), subscriptions_.end(),
                                            [&](const auto& s) { return s.first == topic; }),
                             subscriptions_.end());
    }
    
    if (!connected_.load()) {
        return true;
    }
    
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    
    int rc = MQTTAsync_unsubscribe(client_, topic.c_str(), &opts);
    return rc == MQTTASYNC_SUCCESS;
}

void PahoMqttClient::setMessageCallback(MessageCallback callback) {
    messageCallback_ = std::move(callback);
}

void PahoMqttClient::setConnectionCallback(ConnectionCallback callback) {
    connectionCallback_ = std::move(callback);
}

void PahoMqttClient::processEvents() {
    std::deque<std::function<void()>> pending;
    {
        std::lock_guard<std::mutex> lock(eventMutex_);
        pending.swap(events_);
    }
    
    for (auto& event : pending) {
        event();
    }
}

int PahoMqttClient::messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message) {
    (void)topicLen;  // topicName is null-terminated
    
    auto* client = static_cast<PahoMqttClient*>(context);
    
    MqttMessage msg;
    msg.topic = std::string(topicName);
    msg.payload = std::string(static_cast<char*>(message->payload), message->payloadlen);
    msg.qos = message->qos;
    msg.retained = message->retained != 0;
    
    client->postEvent([client, msg] {
        if (client->messageCallback_) {
            client->messageCallback_(msg);
        }
    });
    
    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topicName);
    return 1;
}

void PahoMqttClient::onConnected(void* context, char* cause) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_.store(true);
    
    std::string reason = cause ? std::string(cause) : "Connected";
    std::cout << "[MQTT] Connected (" << reason << ")" << std::endl;
    
    client->restoreSession();
    client->postEvent([client, reason] {
        if (client->connectionCallback_) {
            client->connectionCallback_(true, reason);
        }
    });
}

void PahoMqttClient::onConnectFailure(void* context, MQTTAsync_failureData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_.store(false);
    
    std::string reason = "Connection failed";
    if (response) {
        reason = "CONNACK return code " + std::to_string(response->code);
        if (response->message) {
            reason += " (" + std::string(response->message) + ")";
        }
    }
    std::cerr << "[MQTT] " << reason << std::endl;
    
    client->postEvent([client, reason] {
        if (client->connectionCallback_) {
            client->connectionCallback_(false, reason);
        }
    });
}

void PahoMqttClient::connectionLost(void* context, char* cause) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_.store(false);
    
    std::string reason = cause ? std::string(cause) : "Connection lost";
    std::cerr << "[MQTT] " << reason << ", reconnecting" << std::endl;
    
    client->postEvent([client, reason] {
        if (client->connectionCallback_) {
            client->connectionCallback_(false, reason);
        }
    });
}

void PahoMqttClient::onDisconnected(void* context, MQTTAsync_successData* response) {
    (void)response;  // Response data not needed for disconnect
    
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_.store(false);
}

bool PahoMqttClient::sendMessage(const MqttMessage& message) {
    MQTTAsync_message pubmsg = MQTTAsync_message_initializer;
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    
    pubmsg.payload = const_cast<void*>(static_cast<const void*>(message.payload.c_str()));
    pubmsg.payloadlen = static_cast<int>(message.payload.length());
    pubmsg.qos = message.qos;
    pubmsg.retained = message.retained ? 1 : 0;
    
    int rc = MQTTAsync_sendMessage(client_, message.topic.c_str(), &pubmsg, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Publish to " << message.topic << " failed, error code: " << rc << std::endl;
        return false;
    }
    return true;
}

bool PahoMqttClient::sendSubscribe(const std::string& topic, int qos) {
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    
    int rc = MQTTAsync_subscribe(client_, topic.c_str(), qos, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Subscribe to " << topic << " failed, error code: " << rc << std::endl;
        return false;
    }
    return true;
}

void PahoMqttClient::restoreSession() {
    std::vector<std::pair<std::string, int>> subscriptions;
    {
        std::lock_guard<std::mutex> lock(subscriptionMutex_);
        subscriptions = subscriptions_;
    }
    for (const auto& [topic, qos] : subscriptions) {
        sendSubscribe(topic, qos);
    }
    
    std::deque<MqttMessage> queued;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        queued.swap(offlineQueue_);
    }
    if (!queued.empty()) {
        std::cout << "[MQTT] Sending " << queued.size() << " queued message(s)" << std::endl;
    }
    for (const auto& message : queued) {
        if (!sendMessage(message)) {
            queueMessage(message);
        }
    }
}

void PahoMqttClient::queueMessage(const MqttMessage& message) {
    std::lock_guard<std::mutex> lock(queueMutex_);
    
    // Only the latest value per topic matters for retained state
    auto it = std::find_if(offlineQueue_.begin(), offlineQueue_.end(),
                           [&](const MqttMessage& m) { return m.topic == message.topic; });
    if (it != offlineQueue_.end()) {
        *it = message;
        return;
    }
    
    // Remove oldest message if queue is full (FIFO behavior)
    if (offlineQueue_.size() >= kMaxOfflineQueueSize) {
        offlineQueue_.pop_front();
    }
    offlineQueue_.push_back(message);
}

void PahoMqttClient::postEvent(std::function<void()> event) {
    std::lock_guard<std::mutex> lock(eventMutex_);
    events_.push_back(std::move(event));
}

bool PahoMqttClient::validateCertificateFiles(const TlsConfig& tlsConfig) const {
    auto readable = [](const std::string& path, const char* what) {
        if (path.empty()) return true;
        std::ifstream file(path);
        if (!file.good()) {
            std::cerr << "[MQTT] ERROR: " << what << " not found: " << path << std::endl;
            return false;
        }
        return true;
    };
    
    if (tlsConfig.certPath.empty() != tlsConfig.keyPath.empty()) {
        std::cerr << "[MQTT] ERROR: Client certificate and key must be configured together" << std::endl;
        return false;
    }
    
    return readable(tlsConfig.certPath, "Certificate file") &&
           readable(tlsConfig.keyPath, "Private key file") &&
           readable(tlsConfig.caPath, "CA file");
}

} // namespace geoshare
