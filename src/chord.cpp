#include "chord.hpp"

#include <linux/input-event-codes.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

static std::string lower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back((char)std::tolower(c));
    return out;
}

static std::string trim_ws(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace((unsigned char)s[a])) a++;
    while (b > a && std::isspace((unsigned char)s[b - 1])) b--;
    return s.substr(a, b - a);
}

// Modifier names expand to both left and right variants.
static bool modifier_codes(const std::string& name, std::vector<int>& out) {
    if (name == "alt" || name == "option") {
        out = {KEY_LEFTALT, KEY_RIGHTALT};
    } else if (name == "ctrl" || name == "control") {
        out = {KEY_LEFTCTRL, KEY_RIGHTCTRL};
    } else if (name == "shift") {
        out = {KEY_LEFTSHIFT, KEY_RIGHTSHIFT};
    } else if (name == "super" || name == "meta" || name == "win") {
        out = {KEY_LEFTMETA, KEY_RIGHTMETA};
    } else {
        return false;
    }
    return true;
}

int key_code_from_name(const std::string& raw) {
    const std::string name = lower(trim_ws(raw));

    static const struct { const char* name; int code; } named[] = {
        {"space", KEY_SPACE},   {"esc", KEY_ESC},         {"escape", KEY_ESC},
        {"enter", KEY_ENTER},   {"return", KEY_ENTER},    {"tab", KEY_TAB},
        {"backspace", KEY_BACKSPACE},
        {"period", KEY_DOT},    {"comma", KEY_COMMA},     {"slash", KEY_SLASH},
        {"semicolon", KEY_SEMICOLON}, {"grave", KEY_GRAVE},
        {"capslock", KEY_CAPSLOCK},   {"pause", KEY_PAUSE},
        {"leftalt", KEY_LEFTALT},     {"rightalt", KEY_RIGHTALT},
        {"leftctrl", KEY_LEFTCTRL},   {"rightctrl", KEY_RIGHTCTRL},
        {"leftshift", KEY_LEFTSHIFT}, {"rightshift", KEY_RIGHTSHIFT},
        {"leftmeta", KEY_LEFTMETA},   {"rightmeta", KEY_RIGHTMETA},
    };
    for (const auto& n : named) {
        if (name == n.name) return n.code;
    }

    if (name.size() == 1 && name[0] >= 'a' && name[0] <= 'z') {
        static const int letters[] = {
            KEY_A, KEY_B, KEY_C, KEY_D, KEY_E, KEY_F, KEY_G, KEY_H, KEY_I,
            KEY_J, KEY_K, KEY_L, KEY_M, KEY_N, KEY_O, KEY_P, KEY_Q, KEY_R,
            KEY_S, KEY_T, KEY_U, KEY_V, KEY_W, KEY_X, KEY_Y, KEY_Z,
        };
        return letters[name[0] - 'a'];
    }

    if (name.size() >= 2 && name[0] == 'f') {
        static const int fkeys[] = {
            KEY_F1, KEY_F2, KEY_F3, KEY_F4, KEY_F5, KEY_F6,
            KEY_F7, KEY_F8, KEY_F9, KEY_F10, KEY_F11, KEY_F12,
        };
        const std::string digits = name.substr(1);
        if (std::all_of(digits.begin(), digits.end(), [](unsigned char c){ return std::isdigit(c); })) {
            const int n = std::stoi(digits);
            if (n >= 1 && n <= 12) return fkeys[n - 1];
        }
    }

    return -1;
}

KeyBinding parse_key_binding(const std::string& binding) {
    KeyBinding kb;

    std::vector<std::string> parts;
    std::string cur;
    for (char c : binding) {
        if (c == '+') { parts.push_back(trim_ws(cur)); cur.clear(); }
        else cur.push_back(c);
    }
    parts.push_back(trim_ws(cur));

    if (parts.empty() || parts.size() > 2) {
        throw std::invalid_argument("bad key binding '" + binding + "'");
    }

    if (parts.size() == 2) {
        if (!modifier_codes(lower(parts[0]), kb.modifiers)) {
            throw std::invalid_argument("unknown modifier '" + parts[0] + "' in '" + binding + "'");
        }
    }

    kb.key = key_code_from_name(parts.back());
    if (kb.key < 0) {
        throw std::invalid_argument("unknown key '" + parts.back() + "' in '" + binding + "'");
    }
    return kb;
}

// ------------------------------------------------------------

ChordTracker::ChordTracker(const Params& p) : p_(p) {}

void ChordTracker::reset() {
    held_modifiers_.clear();
    chord_active_ = false;
}

bool ChordTracker::is_modifier(int code) const {
    const auto& m = p_.hotkey.modifiers;
    return std::find(m.begin(), m.end(), code) != m.end();
}

std::vector<ChordTracker::Action> ChordTracker::feed(int code, int value) {
    std::vector<Action> out;

    if (is_modifier(code)) {
        auto it = std::find(held_modifiers_.begin(), held_modifiers_.end(), code);
        if (value == 1) {
            if (it == held_modifiers_.end()) held_modifiers_.push_back(code);
        } else if (value == 0) {
            if (it != held_modifiers_.end()) held_modifiers_.erase(it);
            if (held_modifiers_.empty() && chord_active_) {
                chord_active_ = false;
                out.push_back(Action::HotkeyUp);
            }
        }
        return out;
    }

    if (code == p_.hotkey.key) {
        const bool armed = p_.hotkey.modifiers.empty() || modifier_held();
        if (value == 1 && armed) {
            chord_active_ = true;
            out.push_back(Action::HotkeyDown);
            // Same key as confirm: a pending result is confirmed even with
            // the modifier still down. The machine ignores whichever action
            // does not apply.
            if (code == p_.confirm_key) out.push_back(Action::Confirm);
            return out;
        }
        if (value == 2 && chord_active_) {
            out.push_back(Action::HotkeyDown);
            return out;
        }
        if (value == 0 && chord_active_) {
            chord_active_ = false;
            out.push_back(Action::HotkeyUp);
            return out;
        }
    }

    if (value != 1) return out;

    if (code == p_.cancel_key) {
        out.push_back(Action::Cancel);
    } else if (code == p_.confirm_key) {
        out.push_back(Action::Confirm);
    }
    return out;
}

const char* ChordTracker::action_name(Action a) {
    switch (a) {
        case Action::HotkeyDown: return "HotkeyDown";
        case Action::HotkeyUp:   return "HotkeyUp";
        case Action::Confirm:    return "Confirm";
        case Action::Cancel:     return "Cancel";
    }
    return "Unknown";
}
