/**
 * @file IMqttClient.hpp
 * @brief MQTT client interface backing the shared location store
 * 
 * Provides a platform-independent MQTT client abstraction. The store adapter uses
 * retained messages as its last-value cache, so the interface exposes the retain
 * flag and wildcard subscriptions directly.
 * 
 * @note Interface supports both plain TCP and TLS broker connections
 * @note Callbacks are delivered from processEvents(), on the caller's thread
 */

#pragma once

#include <string>
#include <functional>
#include <memory>
#include <cstdint>

namespace geoshare {

/**
 * @brief MQTT message structure for inbound and outbound traffic
 * 
 * @note An empty retained payload clears the retained value on the broker
 * @note QoS levels: 0 (at most once), 1 (at least once), 2 (exactly once)
 */
struct MqttMessage {
    std::string topic;              ///< MQTT topic (e.g., "geoshare/presence/alice")
    std::string payload;            ///< Message payload (JSON presence record, or empty)
    int qos = 0;                   ///< Quality of Service level (0, 1, or 2)
    bool retained = false;         ///< Retain flag for last-value messages
};

/**
 * @brief TLS configuration for broker connections
 * 
 * Client certificate and key are optional; when both are empty the connection is
 * server-authenticated only and the username/password pair is used for login.
 * 
 * @note Certificate files must be in PEM format
 */
struct TlsConfig {
    std::string certPath;          ///< Path to client certificate file (.pem), optional
    std::string keyPath;           ///< Path to private key file (.pem), optional
    std::string caPath;            ///< Path to root CA certificate file (.pem)
    bool verifyServer = true;      ///< Enable server certificate validation
};

/**
 * @brief Platform-independent MQTT client interface
 * 
 * @note Platform implementations can use Paho MQTT (desktop) or coreMQTT (embedded)
 * @note Subscriptions are remembered and restored after a reconnect
 */
class IMqttClient {
public:
    /// Virtual destructor for proper cleanup in derived classes
    virtual ~IMqttClient() = default;
    
    /// Callback function type for incoming MQTT messages
    using MessageCallback = std::function<void(const MqttMessage&)>;
    
    /// Callback function type for connection state changes
    using ConnectionCallback = std::function<void(bool connected, const std::string& reason)>;
    
    /**
     * @brief Connect to MQTT broker over plain TCP
     * @param host MQTT broker hostname
     * @param port MQTT broker port (typically 1883)
     * @param clientId Unique client identifier
     * @param username MQTT username, may be empty
     * @param password MQTT password, may be empty
     * @return true if connection initiated successfully, false otherwise
     * @note This method initiates asynchronous connection - use callback for status
     */
    virtual bool connect(const std::string& host, std::uint16_t port, 
                        const std::string& clientId,
                        const std::string& username, 
                        const std::string& password) = 0;
    
    /**
     * @brief Connect to MQTT broker over TLS
     * @param host MQTT broker hostname
     * @param port MQTT broker port (typically 8883)
     * @param clientId Unique client identifier
     * @param username MQTT username, may be empty
     * @param password MQTT password, may be empty
     * @param tlsConfig TLS configuration with certificate paths
     * @return true if connection initiated successfully, false otherwise
     */
    virtual bool connectWithTls(const std::string& host, std::uint16_t port,
                               const std::string& clientId,
                               const std::string& username,
                               const std::string& password,
                               const TlsConfig& tlsConfig) = 0;
    
    /**
     * @brief Disconnect from MQTT broker
     */
    virtual void disconnect() = 0;
    
    /**
     * @brief Check if currently connected to MQTT broker
     * @return true if connected, false otherwise
     */
    virtual bool isConnected() const = 0;
    
    /**
     * @brief Publish message to MQTT topic
     * @param topic MQTT topic to publish to
     * @param payload Message payload
     * @param qos Quality of Service level (0, 1, or 2)
     * @param retained Whether message should be retained by broker
     * @return true if handed to the broker connection, false otherwise
     * @note While offline the latest message per topic is queued and false is returned
     */
    virtual bool publish(const std::string& topic, const std::string& payload, 
                        int qos = 0, bool retained = false) = 0;
    
    /**
     * @brief Subscribe to MQTT topic filter
     * @param topic MQTT topic filter (supports '+' and '#' wildcards)
     * @param qos Maximum Quality of Service level for received messages
     * @return true if subscription was sent or recorded for the next connection
     */
    virtual bool subscribe(const std::string& topic, int qos = 0) = 0;
    
    /**
     * @brief Unsubscribe from MQTT topic filter
     * @param topic MQTT topic filter to unsubscribe from
     * @return true if unsubscription succeeded, false otherwise
     */
    virtual bool unsubscribe(const std::string& topic) = 0;
    
    /**
     * @brief Set callback for incoming MQTT messages
     * @param callback Function to call when message is received
     */
    virtual void setMessageCallback(MessageCallback callback) = 0;
    
    /**
     * @brief Set callback for connection state changes
     * @param callback Function to call when connection state changes
     */
    virtual void setConnectionCallback(ConnectionCallback callback) = 0;
    
    /**
     * @brief Deliver messages and connection events received since the last call
     * @note Non-blocking; callbacks run on the calling thread
     */
    virtual void processEvents() = 0;

protected:
    // Protected constructors to prevent direct instantiation
    IMqttClient() = default;
    IMqttClient(const IMqttClient&) = default;
    IMqttClient& operator=(const IMqttClient&) = default;
    IMqttClient(IMqttClient&&) = default;
    IMqttClient& operator=(IMqttClient&&) = default;
};

} // namespace geoshare
