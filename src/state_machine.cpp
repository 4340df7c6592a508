#include "state_machine.hpp"

QuillStateMachine::State QuillStateMachine::state() const {
    std::lock_guard<std::mutex> lk(m_);
    return st_;
}

void QuillStateMachine::set_observer(Observer obs) {
    std::lock_guard<std::mutex> lk(m_);
    obs_ = std::move(obs);
}

bool QuillStateMachine::dispatch(Event ev, const std::string& note) {
    Observer obs_copy;
    State from, to;
    bool did = false;

    {
        std::lock_guard<std::mutex> lk(m_);
        from = st_;
        to = transition_locked(st_, ev, did);
        if (did) st_ = to;
        obs_copy = obs_;
    }

    // Invoke observer outside lock.
    if (did && obs_copy) {
        obs_copy(from, to, ev, note);
    }
    return did;
}

QuillStateMachine::State
QuillStateMachine::transition_locked(QuillStateMachine::State cur,
                                     QuillStateMachine::Event ev,
                                     bool& did_transition) const
{
    did_transition = false;

    if (ev == Event::Stop) {
        if (cur == State::Shutdown) return cur;
        did_transition = true;
        return State::Shutdown;
    }

    switch (cur) {
        case State::Idle:
            if (ev == Event::HotkeyDown) { did_transition = true; return State::Recording; }
            break;

        case State::Recording:
            if (ev == Event::HotkeyUp) { did_transition = true; return State::Processing; }
            if (ev == Event::TooShort || ev == Event::Fail) {
                did_transition = true;
                return State::Idle;
            }
            if (ev == Event::Cancel) { did_transition = true; return State::Cancelled; }
            break;

        case State::Processing:
            if (ev == Event::Recognized) { did_transition = true; return State::AwaitingConfirm; }
            if (ev == Event::Fail) { did_transition = true; return State::Idle; }
            if (ev == Event::Cancel) { did_transition = true; return State::Cancelled; }
            break;

        case State::AwaitingConfirm:
            // Hotkey-down is deliberately absent: the pending text must be
            // resolved before a new recording can start.
            if (ev == Event::Confirm) { did_transition = true; return State::Inserted; }
            if (ev == Event::Cancel) { did_transition = true; return State::Cancelled; }
            break;

        case State::Inserted:
        case State::Cancelled:
            if (ev == Event::Done) { did_transition = true; return State::Idle; }
            break;

        case State::Shutdown:
            break;
    }

    return cur;
}

const char* QuillStateMachine::state_name(State s) {
    switch (s) {
        case State::Idle:            return "Idle";
        case State::Recording:       return "Recording";
        case State::Processing:      return "Processing";
        case State::AwaitingConfirm: return "AwaitingConfirm";
        case State::Inserted:        return "Inserted";
        case State::Cancelled:       return "Cancelled";
        case State::Shutdown:        return "Shutdown";
    }
    return "Unknown";
}

const char* QuillStateMachine::event_name(Event e) {
    switch (e) {
        case Event::HotkeyDown: return "HotkeyDown";
        case Event::HotkeyUp:   return "HotkeyUp";
        case Event::TooShort:   return "TooShort";
        case Event::Recognized: return "Recognized";
        case Event::Confirm:    return "Confirm";
        case Event::Cancel:     return "Cancel";
        case Event::Done:       return "Done";
        case Event::Fail:       return "Fail";
        case Event::Stop:       return "Stop";
    }
    return "Unknown";
}
