#include "event_queue.hpp"

void EventQueue::push(DictationEvent ev) {
    {
        std::lock_guard<std::mutex> lk(m_);
        if (closed_) return;
        q_.emplace_back(std::move(ev));
    }
    cv_.notify_one();
}

bool EventQueue::pop(DictationEvent& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(m_);
    cv_.wait_for(lk, timeout, [&]{ return closed_ || !q_.empty(); });
    if (q_.empty()) return false;

    out = std::move(q_.front());
    q_.pop_front();
    return true;
}

void EventQueue::close() {
    {
        std::lock_guard<std::mutex> lk(m_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventQueue::closed() const {
    std::lock_guard<std::mutex> lk(m_);
    return closed_;
}

std::size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lk(m_);
    return q_.size();
}

const char* dictation_event_name(DictationEvent::Kind k) {
    switch (k) {
        case DictationEvent::Kind::HotkeyDown:      return "HotkeyDown";
        case DictationEvent::Kind::HotkeyUp:        return "HotkeyUp";
        case DictationEvent::Kind::Confirm:         return "Confirm";
        case DictationEvent::Kind::Cancel:          return "Cancel";
        case DictationEvent::Kind::RecognitionDone: return "RecognitionDone";
        case DictationEvent::Kind::Shutdown:        return "Shutdown";
    }
    return "Unknown";
}
