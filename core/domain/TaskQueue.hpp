#pragma once

#include "../ports/IDispatcher.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

namespace geoshare::domain {

/**
 * @brief Serial task queue drained by the background worker (or directly by tests).
 *
 * Sample deliveries, store callbacks and control requests from other threads are
 * posted here so that the tracking and presence components only ever run on one
 * thread at a time.
 */
class TaskQueue : public ports::IDispatcher {
public:
    TaskQueue() = default;
    ~TaskQueue() override = default;

    void post(Task task) override;
    
    /// Runs queued tasks, including ones posted while draining. Returns the number run.
    std::size_t drain();
    
    /// Blocks until a task is posted or the timeout expires.
    bool waitForTasks(std::chrono::milliseconds timeout);
    
    /// Wakes any waiter without posting a task.
    void wake();
    
    std::size_t size() const;

private:
    std::queue<Task> tasks_;
    mutable std::mutex queueMutex_;
    std::condition_variable cv_;
    bool woken_ = false;
    bool processing_ = false;
};

} // namespace geoshare::domain
