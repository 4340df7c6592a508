// keyboard.hpp
#pragma once

#include "chord.hpp"

#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <vector>

// Global key listener reading /dev/input/event* (needs the `input` group).
// Events are observed, not grabbed: other applications still see them.
class KeyboardListener {
public:
    using Callback = std::function<void(ChordTracker::Action action)>;

    struct Params {
        ChordTracker::Params keys;
        std::string input_dir = "/dev/input";
    };

    KeyboardListener(const Params& p, Callback cb);
    ~KeyboardListener();

    KeyboardListener(const KeyboardListener&) = delete;
    KeyboardListener& operator=(const KeyboardListener&) = delete;

    // Open keyboards and start the reader thread.
    // Throws std::runtime_error if no keyboard device can be opened.
    void start();
    void stop();

    std::size_t device_count() const { return fds_.size(); }

private:
    void run();
    void close_all();

    Params p_;
    Callback cb_;
    ChordTracker tracker_;

    std::vector<int> fds_;
    int wake_pipe_[2] = {-1, -1};

    std::thread thread_;
    std::atomic<bool> running_{false};
};
