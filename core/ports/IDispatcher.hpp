#pragma once

#include <functional>

namespace geoshare::ports {

/// Serial execution context. Tasks run one at a time, in posting order.
class IDispatcher {
public:
    virtual ~IDispatcher() = default;
    
    using Task = std::function<void()>;
    
    /// Thread-safe. Never runs the task inline.
    virtual void post(Task task) = 0;
};

} // namespace geoshare::ports
