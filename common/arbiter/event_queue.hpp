#pragma once

#include "event.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <list>
#include <mutex>
#include <thread>

namespace arbiter {

// Single-worker FIFO. Producers on any thread post; one worker thread
// hands events to the handler in the order they were posted.
class EventQueue {
public:
    using Handler = std::function<void(const Event&)>;

    EventQueue() = default;
    ~EventQueue();

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    // Starts the worker. Returns false if already running.
    bool start(Handler handler);

    // Stops the worker; pending events are discarded
    void stop();

    // Returns false if the queue is not running
    bool post(Event event);

    // Blocks until the queue is empty and the handler is idle
    bool wait_for_idle(std::chrono::milliseconds timeout);

    bool running() const;

private:
    void worker_loop();

    mutable std::mutex mutex_;
    std::condition_variable condition_variable_;
    std::list<Event> pending_;
    Handler handler_;
    std::thread worker_;
    bool running_ = false;
    bool busy_ = false;
};

} // namespace arbiter
