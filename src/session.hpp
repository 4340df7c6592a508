#pragma once

#include "recognizer.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <utility>

using Clock = std::chrono::steady_clock;

// One recording-to-confirmation attempt.
struct Session {
    uint64_t id = 0;
    Clock::time_point started_at;
    std::size_t samples = 0;  // set when the buffer is frozen
    bool frozen = false;
};

// Everything the controller reacts to. Posted from the key listener thread
// and the recognition worker; consumed by the controller thread only.
struct DictationEvent {
    enum class Kind {
        HotkeyDown,
        HotkeyUp,
        Confirm,
        Cancel,
        RecognitionDone,
        Shutdown,
    };

    Kind kind = Kind::Shutdown;
    Clock::time_point at = Clock::now();

    // RecognitionDone only.
    uint64_t session_id = 0;
    RecognitionResult result;

    static DictationEvent key(Kind k, Clock::time_point t = Clock::now()) {
        DictationEvent ev;
        ev.kind = k;
        ev.at = t;
        return ev;
    }

    static DictationEvent recognized(uint64_t id, RecognitionResult r) {
        DictationEvent ev;
        ev.kind = Kind::RecognitionDone;
        ev.session_id = id;
        ev.result = std::move(r);
        return ev;
    }
};

const char* dictation_event_name(DictationEvent::Kind k);
