#include "BackgroundWorker.hpp"
#include <exception>
#include <iostream>
#include <stdexcept>

namespace geoshare::domain {

BackgroundWorker::BackgroundWorker(std::shared_ptr<TaskQueue> queue,
                                   std::chrono::milliseconds tickInterval)
    : queue_(std::move(queue)), tickInterval_(tickInterval) {
    if (!queue_) {
        throw std::invalid_argument("BackgroundWorker requires a task queue");
    }
    if (tickInterval_.count() <= 0) {
        throw std::invalid_argument("BackgroundWorker tick interval must be positive");
    }
}

BackgroundWorker::~BackgroundWorker() {
    stop();
}

void BackgroundWorker::start(TickHandler onTick) {
    if (running_.exchange(true)) return;
    
    onTick_ = std::move(onTick);
    thread_ = std::thread([this] { run(); });
    std::cout << "[Worker] Started (tick " << tickInterval_.count() << "ms)" << std::endl;
}

void BackgroundWorker::stop() {
    if (!running_.exchange(false)) return;
    
    queue_->wake();
    if (thread_.joinable()) {
        thread_.join();
    }
    
    // Whatever was posted before stop() still runs, on the caller's thread
    queue_->drain();
    std::cout << "[Worker] Stopped" << std::endl;
}

bool BackgroundWorker::isWorkerThread() const {
    return std::this_thread::get_id() == thread_.get_id();
}

void BackgroundWorker::run() {
    auto nextTick = std::chrono::steady_clock::now();
    
    while (running_.load()) {
        queue_->drain();
        
        auto now = std::chrono::steady_clock::now();
        if (now >= nextTick) {
            if (onTick_) {
                try {
                    onTick_();
                } catch (const std::exception& e) {
                    std::cerr << "[Worker] Tick failed: " << e.what() << std::endl;
                }
            }
            nextTick = now + tickInterval_;
        }
        
        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(nextTick - std::chrono::steady_clock::now());
        if (wait.count() > 0) {
            queue_->waitForTasks(wait);
        }
    }
}

} // namespace geoshare::domain
