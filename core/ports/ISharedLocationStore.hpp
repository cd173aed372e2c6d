#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace geoshare::ports {

/**
 * @brief Real-time key/value store with pub/sub and last-value cache semantics.
 *
 * put() is last-write-wins per key. A subscriber receives the cached value of
 * every matching key when it subscribes, then every subsequent change. A removed
 * key is delivered with an empty value.
 *
 * Calls never block on the network: put()/remove() return false when the write
 * could not be handed to the transport, and callers own the retry.
 */
class ISharedLocationStore {
public:
    virtual ~ISharedLocationStore() = default;
    
    using SubscriptionId = uint64_t;
    using ValueHandler = std::function<void(const std::string& key, const std::optional<std::string>& value)>;
    using ConnectionHandler = std::function<void(bool connected, std::string_view reason)>;
    
    static constexpr SubscriptionId kInvalidSubscription = 0;
    
    virtual bool put(const std::string& key, const std::string& value) = 0;
    virtual bool remove(const std::string& key) = 0;
    
    /// Pattern uses MQTT wildcards ('+', '#'). Returns kInvalidSubscription on failure.
    virtual SubscriptionId onValueChanged(const std::string& keyPattern, ValueHandler handler) = 0;
    virtual void cancel(SubscriptionId id) = 0;
    
    virtual bool isConnected() const = 0;
    virtual void setConnectionHandler(ConnectionHandler handler) = 0;
    
    virtual void processEvents() = 0;
};

} // namespace geoshare::ports
