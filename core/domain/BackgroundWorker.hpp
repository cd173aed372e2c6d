#pragma once

#include "TaskQueue.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <thread>

namespace geoshare::domain {

/**
 * @brief Long-lived execution context for one device.
 *
 * Drains the task queue as tasks arrive and invokes the tick callback at a fixed
 * cadence. Timers of the hosted components are evaluated inside tick, so nothing
 * hosted here needs a thread of its own.
 */
class BackgroundWorker {
public:
    using TickHandler = std::function<void()>;

    BackgroundWorker(std::shared_ptr<TaskQueue> queue,
                     std::chrono::milliseconds tickInterval = std::chrono::seconds(1));
    ~BackgroundWorker();
    
    BackgroundWorker(const BackgroundWorker&) = delete;
    BackgroundWorker& operator=(const BackgroundWorker&) = delete;

    void start(TickHandler onTick);
    void stop();
    
    bool isRunning() const { return running_.load(); }
    bool isWorkerThread() const;

private:
    void run();

    std::shared_ptr<TaskQueue> queue_;
    std::chrono::milliseconds tickInterval_;
    TickHandler onTick_;
    
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace geoshare::domain
