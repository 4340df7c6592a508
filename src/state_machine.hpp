#pragma once

#include <functional>
#include <mutex>
#include <string>

/*
 * QuillStateMachine
 *
 * Pure transition table for the push-to-talk protocol. Events that have no
 * transition from the current state are ignored (dispatch returns false);
 * the controller relies on that to drop key repeats and stray events.
 */

class QuillStateMachine
{
public:
    enum class State {
        Idle,
        Recording,
        Processing,
        AwaitingConfirm,
        Inserted,
        Cancelled,
        Shutdown,
    };

    enum class Event {
        HotkeyDown,
        HotkeyUp,
        TooShort,
        Recognized,
        Confirm,
        Cancel,
        Done,
        Fail,
        Stop,
    };

    using Observer = std::function<void(State from, State to, Event why, const std::string& note)>;

    QuillStateMachine() = default;
    ~QuillStateMachine() = default;

    // Current state snapshot.
    State state() const;

    // Dispatch an event. Returns true if it caused a transition.
    // Optional note is for debugging/logging.
    bool dispatch(Event ev, const std::string& note = "");

    // Subscribe to transitions (called on every transition).
    void set_observer(Observer obs);

    static const char* state_name(State s);
    static const char* event_name(Event e);

private:
    State transition_locked(State cur, Event ev, bool& did_transition) const;

    mutable std::mutex m_;
    State st_ = State::Idle;
    Observer obs_;
};
