#pragma once

#include <string>
#include <vector>

// Key binding expressed in evdev key codes.
struct KeyBinding {
    std::vector<int> modifiers;  // any one of these counts as "held"
    int key = 0;
};

// Parse "alt+space", "ctrl+period", "esc", ... into evdev codes.
// Throws std::invalid_argument on unknown names.
KeyBinding parse_key_binding(const std::string& binding);

// Single key name to evdev code. Returns -1 if unknown.
int key_code_from_name(const std::string& name);

/*
 * ChordTracker
 *
 * Turns raw key down/up/repeat events into dictation actions. The chord is
 * "modifier held + key"; releasing either half ends it.
 */

class ChordTracker {
public:
    enum class Action {
        HotkeyDown,
        HotkeyUp,
        Confirm,
        Cancel,
    };

    struct Params {
        KeyBinding hotkey;
        int confirm_key = 0;
        int cancel_key = 0;
    };

    explicit ChordTracker(const Params& p);

    // value: 0 = release, 1 = press, 2 = autorepeat (evdev EV_KEY semantics).
    std::vector<Action> feed(int code, int value);

    bool chord_active() const { return chord_active_; }
    bool modifier_held() const { return !held_modifiers_.empty(); }

    void reset();

    static const char* action_name(Action a);

private:
    bool is_modifier(int code) const;

    Params p_;
    std::vector<int> held_modifiers_;
    bool chord_active_ = false;
};
