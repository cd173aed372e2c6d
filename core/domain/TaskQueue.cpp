#include "TaskQueue.hpp"
#include <exception>
#include <iostream>

namespace geoshare::domain {

void TaskQueue::post(Task task) {
    if (!task) return;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
}

std::size_t TaskQueue::drain() {
    if (processing_) return 0; // Prevent recursive draining
    
    processing_ = true;
    std::size_t executed = 0;
    
    while (true) {
        Task task;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (tasks_.empty()) break;
            
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        
        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[TaskQueue] Task failed: " << e.what() << std::endl;
        }
        ++executed;
    }
    
    processing_ = false;
    return executed;
}

bool TaskQueue::waitForTasks(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queueMutex_);
    bool ready = cv_.wait_for(lock, timeout, [this] { return !tasks_.empty() || woken_; });
    woken_ = false;
    return ready && !tasks_.empty();
}

void TaskQueue::wake() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        woken_ = true;
    }
    cv_.notify_all();
}

std::size_t TaskQueue::size() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return tasks_.size();
}

} // namespace geoshare::domain
