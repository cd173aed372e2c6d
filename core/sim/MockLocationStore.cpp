#include "MockLocationStore.hpp"
#include "../KeyPattern.hpp"
#include <algorithm>

namespace geoshare::sim {

bool MockLocationStore::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!acceptWriteLocked()) {
        return false;
    }
    
    values_[key] = value;
    writes_.push_back(MockWrite{key, value});
    enqueueLocked(key, value);
    return true;
}

bool MockLocationStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!acceptWriteLocked()) {
        return false;
    }
    
    values_.erase(key);
    writes_.push_back(MockWrite{key, std::nullopt});
    enqueueLocked(key, std::nullopt);
    return true;
}

ports::ISharedLocationStore::SubscriptionId MockLocationStore::onValueChanged(const std::string& keyPattern,
                                                                             ValueHandler handler) {
    if (!isValidKeyPattern(keyPattern) || !handler) {
        return kInvalidSubscription;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = nextSubscriptionId_++;
    subscriptions_[id] = Subscription{keyPattern, std::move(handler)};
    
    // Last-value cache: replay everything the new subscriber would have missed
    for (const auto& [key, value] : values_) {
        if (keyMatchesPattern(keyPattern, key)) {
            deliveries_.push_back(Delivery{id, key, value});
        }
    }
    return id;
}

void MockLocationStore::cancel(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.erase(id);
    deliveries_.erase(std::remove_if(deliveries_.begin(), deliveries_.end(),
                                     [id](const Delivery& d) { return d.subscription == id; }),
                      deliveries_.end());
}

bool MockLocationStore::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

void MockLocationStore::setConnectionHandler(ConnectionHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    connectionHandler_ = std::move(handler);
}

void MockLocationStore::processEvents() {
    std::deque<Delivery> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_) return;
        batch.swap(deliveries_);
        if (reverseDelivery_) {
            std::reverse(batch.begin(), batch.end());
        }
    }
    
    for (const auto& delivery : batch) {
        ValueHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = subscriptions_.find(delivery.subscription);
            if (it == subscriptions_.end()) continue;
            handler = it->second.handler;
        }
        handler(delivery.key, delivery.value);
    }
}

void MockLocationStore::setConnected(bool connected) {
    ConnectionHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connected_ == connected) return;
        connected_ = connected;
        handler = connectionHandler_;
    }
    
    if (handler) {
        handler(connected, connected ? "Connected" : "Disconnected");
    }
}

void MockLocationStore::setFailPublish(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failPublish_ = fail;
}

void MockLocationStore::failNextPublishes(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    failCount_ = std::max(count, 0);
}

void MockLocationStore::setReverseDelivery(bool reverse) {
    std::lock_guard<std::mutex> lock(mutex_);
    reverseDelivery_ = reverse;
}

void MockLocationStore::injectValue(const std::string& key, const std::string& rawValue) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = rawValue;
    enqueueLocked(key, rawValue);
}

std::optional<std::string> MockLocationStore::value(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<MockWrite> MockLocationStore::writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
}

void MockLocationStore::clearWrites() {
    std::lock_guard<std::mutex> lock(mutex_);
    writes_.clear();
}

std::size_t MockLocationStore::pendingDeliveries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deliveries_.size();
}

std::size_t MockLocationStore::subscriptionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

bool MockLocationStore::acceptWriteLocked() {
    if (!connected_ || failPublish_) {
        return false;
    }
    if (failCount_ > 0) {
        --failCount_;
        return false;
    }
    return true;
}

void MockLocationStore::enqueueLocked(const std::string& key, const std::optional<std::string>& value) {
    for (const auto& [id, subscription] : subscriptions_) {
        if (keyMatchesPattern(subscription.pattern, key)) {
            deliveries_.push_back(Delivery{id, key, value});
        }
    }
}

} // namespace geoshare::sim
