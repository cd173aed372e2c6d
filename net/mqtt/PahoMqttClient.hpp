/**
 * @file PahoMqttClient.hpp
 * @brief Paho MQTT C library implementation for desktop platforms
 * 
 * Provides MQTT client implementation using the Eclipse Paho MQTT C asynchronous
 * library. Includes a per-topic offline queue, automatic reconnection and
 * restoration of subscriptions after a reconnect.
 * 
 * @note For embedded platforms, replace with coreMQTT or Paho Embedded C
 * @note Paho invokes its callbacks on its own thread; they are queued and
 *       replayed from processEvents()
 */

#pragma once

#include "IMqttClient.hpp"
#include <MQTTAsync.h>
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace geoshare {

/**
 * @brief Paho MQTT C library implementation of IMqttClient
 * 
 * Features:
 * - Offline queue holding the latest message per topic, bounded in size
 * - Automatic reconnection with exponential backoff (Paho managed)
 * - Subscriptions re-issued on every (re)connect
 * - Thread-safe hand-over of Paho callbacks to the polling thread
 */
class PahoMqttClient : public IMqttClient {
public:
    /**
     * @brief Construct new Paho MQTT client instance
     * @note Client is not connected after construction - call connect() method
     */
    PahoMqttClient();
    
    /**
     * @brief Destructor - ensures clean disconnection and resource cleanup
     */
    ~PahoMqttClient() override;
    
    // Disable copy and assignment to prevent resource management issues
    PahoMqttClient(const PahoMqttClient&) = delete;
    PahoMqttClient& operator=(const PahoMqttClient&) = delete;
    PahoMqttClient(PahoMqttClient&&) = delete;
    PahoMqttClient& operator=(PahoMqttClient&&) = delete;
    
    bool connect(const std::string& host, std::uint16_t port, 
                const std::string& clientId,
                const std::string& username, 
                const std::string& password) override;
    
    bool connectWithTls(const std::string& host, std::uint16_t port,
                       const std::string& clientId,
                       const std::string& username,
                       const std::string& password,
                       const TlsConfig& tlsConfig) override;
    
    void disconnect() override;
    bool isConnected() const override;
    
    bool publish(const std::string& topic, const std::string& payload, 
                int qos = 0, bool retained = false) override;
    
    bool subscribe(const std::string& topic, int qos = 0) override;
    bool unsubscribe(const std::string& topic) override;
    
    void setMessageCallback(MessageCallback callback) override;
    void setConnectionCallback(ConnectionCallback callback) override;
    
    void processEvents() override;
    
private:
    /// Maximum number of topics held while offline
    static constexpr std::size_t kMaxOfflineQueueSize = 100;
    
    /// Keep-alive interval (seconds)
    static constexpr int kKeepAliveIntervalSeconds = 60;
    
    /// Connection timeout (seconds)
    static constexpr int kConnectionTimeoutSeconds = 30;
    
    /// Bounds for Paho's automatic reconnect backoff (seconds)
    static constexpr int kMinRetryIntervalSeconds = 1;
    static constexpr int kMaxRetryIntervalSeconds = 60;
    
    /// Common connection path for TCP and TLS
    bool startConnection(const std::string& serverURI, const std::string& clientId,
                         const std::string& username, const std::string& password,
                         const TlsConfig* tlsConfig);
    
    /**
     * @brief Static callback for incoming MQTT messages
     * @param context Pointer to PahoMqttClient instance
     * @param topicName MQTT topic name (null-terminated)
     * @param topicLen Length of topic name (unused - topic is null-terminated)
     * @param message Paho message structure with payload and metadata
     * @return 1 to indicate successful message processing
     */
    static int messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message);
    
    /**
     * @brief Static callback for every successful (re)connection
     * @param context Pointer to PahoMqttClient instance
     * @param cause Reason string supplied by Paho (may be null)
     */
    static void onConnected(void* context, char* cause);
    
    /**
     * @brief Static callback for failed MQTT connection
     * @param context Pointer to PahoMqttClient instance
     * @param response Failure response with error code and message
     */
    static void onConnectFailure(void* context, MQTTAsync_failureData* response);
    
    /**
     * @brief Static callback for lost MQTT connection
     * @param context Pointer to PahoMqttClient instance
     * @param cause Reason for connection loss (may be null)
     */
    static void connectionLost(void* context, char* cause);
    
    /**
     * @brief Static callback for successful disconnection
     * @param context Pointer to PahoMqttClient instance
     * @param response Success response data
     */
    static void onDisconnected(void* context, MQTTAsync_successData* response);
    
    bool sendMessage(const MqttMessage& message);
    bool sendSubscribe(const std::string& topic, int qos);
    
    /**
     * @brief Re-issue subscriptions and send queued messages after a (re)connect
     */
    void restoreSession();
    
    /**
     * @brief Queue message while offline, replacing any older message for the same topic
     * @note Queue has maximum size limit to prevent memory exhaustion
     */
    void queueMessage(const MqttMessage& message);
    
    void postEvent(std::function<void()> event);
    
    /**
     * @brief Validate certificate files exist and are readable
     * @param tlsConfig TLS configuration with certificate paths
     * @return true if all configured certificate files are accessible, false otherwise
     */
    bool validateCertificateFiles(const TlsConfig& tlsConfig) const;
    
    MQTTAsync client_ = nullptr;          ///< Paho MQTT client handle
    std::atomic<bool> connected_{false};  ///< Current connection state
    
    // Connection parameters kept alive for Paho's reconnect logic
    std::string username_;
    std::string password_;
    TlsConfig tlsConfig_;
    
    MessageCallback messageCallback_;     ///< User callback for incoming messages
    ConnectionCallback connectionCallback_; ///< User callback for connection events
    
    std::deque<MqttMessage> offlineQueue_; ///< Latest message per topic while offline
    std::mutex queueMutex_;               ///< Mutex protecting offline queue
    
    std::vector<std::pair<std::string, int>> subscriptions_; ///< Topic filters to restore
    std::mutex subscriptionMutex_;
    
    std::deque<std::function<void()>> events_; ///< Paho callbacks awaiting processEvents()
    std::mutex eventMutex_;
};

} // namespace geoshare
