#include "event_queue.hpp"
#include <iostream>

namespace arbiter {

EventQueue::~EventQueue() {
    stop();
}

bool EventQueue::start(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return false;
    handler_ = std::move(handler);
    running_ = true;
    worker_ = std::thread([this]() { worker_loop(); });
    return true;
}

void EventQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
        if (!pending_.empty()) {
            std::cout << "arbiter: discarding " << pending_.size() << " pending events" << std::endl;
            pending_.clear();
        }
    }
    condition_variable_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    handler_ = nullptr;
}

bool EventQueue::post(Event event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return false;
        pending_.push_back(std::move(event));
    }
    condition_variable_.notify_all();
    return true;
}

bool EventQueue::wait_for_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return condition_variable_.wait_for(lock, timeout, [this]() {
        return pending_.empty() && !busy_;
    });
}

bool EventQueue::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void EventQueue::worker_loop() {
    while (true) {
        std::unique_lock<std::mutex> lock(mutex_);
        condition_variable_.wait(lock, [this]() { return !running_ || !pending_.empty(); });
        if (!running_) break;

        Event event = std::move(pending_.front());
        pending_.pop_front();
        busy_ = true;
        lock.unlock();

        handler_(event);

        lock.lock();
        busy_ = false;
        bool idle = pending_.empty();
        lock.unlock();
        if (idle) {
            condition_variable_.notify_all();
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    busy_ = false;
    condition_variable_.notify_all();
}

} // namespace arbiter
