#pragma once

#include "session.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

// Multi-producer, single-consumer FIFO feeding the controller.
class EventQueue {
public:
    void push(DictationEvent ev);

    // Wait up to `timeout` for the next event. Returns false on timeout or
    // once closed and drained.
    bool pop(DictationEvent& out, std::chrono::milliseconds timeout);

    void close();
    bool closed() const;
    std::size_t size() const;

private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::deque<DictationEvent> q_;
    bool closed_ = false;
};
