#pragma once

#include "../ports/ISharedLocationStore.hpp"
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace geoshare::sim {

struct MockWrite {
    std::string key;
    std::optional<std::string> value;   ///< Empty for remove()
};

/**
 * @brief In-memory shared store for tests and the offline demo.
 *
 * One instance can back several services to simulate several devices. Changes are
 * queued and delivered on processEvents(), never from inside put(). A new
 * subscription first receives the cached value of every matching key.
 */
class MockLocationStore : public ports::ISharedLocationStore {
public:
    MockLocationStore() = default;
    ~MockLocationStore() override = default;

    // ISharedLocationStore interface
    bool put(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;
    SubscriptionId onValueChanged(const std::string& keyPattern, ValueHandler handler) override;
    void cancel(SubscriptionId id) override;
    bool isConnected() const override;
    void setConnectionHandler(ConnectionHandler handler) override;
    void processEvents() override;

    // Mock-specific methods for testing
    void setConnected(bool connected);
    void simulateConnectionLoss() { setConnected(false); }
    void simulateConnectionRestore() { setConnected(true); }
    
    void setFailPublish(bool fail);
    void failNextPublishes(int count);
    
    /// Delivers queued changes newest first, to exercise out-of-order arrival.
    void setReverseDelivery(bool reverse);
    
    /// Writes a raw value bypassing any validation, e.g. a malformed payload.
    void injectValue(const std::string& key, const std::string& rawValue);
    
    std::optional<std::string> value(const std::string& key) const;
    std::vector<MockWrite> writes() const;
    void clearWrites();
    std::size_t pendingDeliveries() const;
    std::size_t subscriptionCount() const;

private:
    struct Subscription {
        std::string pattern;
        ValueHandler handler;
    };
    
    struct Delivery {
        SubscriptionId subscription;
        std::string key;
        std::optional<std::string> value;
    };
    
    bool acceptWriteLocked();
    void enqueueLocked(const std::string& key, const std::optional<std::string>& value);

    mutable std::mutex mutex_;
    bool connected_ = true;
    bool failPublish_ = false;
    int failCount_ = 0;
    bool reverseDelivery_ = false;
    
    ConnectionHandler connectionHandler_;
    
    std::map<std::string, std::string> values_;
    std::map<SubscriptionId, Subscription> subscriptions_;
    SubscriptionId nextSubscriptionId_ = 1;
    std::deque<Delivery> deliveries_;
    std::vector<MockWrite> writes_;
};

} // namespace geoshare::sim
