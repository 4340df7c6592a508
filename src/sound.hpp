// sound.hpp
#pragma once

#include <mutex>
#include <string>
#include <vector>

#include <sys/types.h>

class SoundPlayer {
public:
    enum class Cue {
        Start,
        Stop,
        Error,
        Success,
    };

    struct Params {
        bool enabled = true;

        // Directory holding start.wav, stop.wav, error.wav, success.wav
        std::string sound_dir = "/usr/share/quill/sounds";

        // Playback binary (aplay -D <device> <wav>)
        std::string player_bin = "aplay";

        // Empty = player default device
        std::string out_device;
    };

    explicit SoundPlayer(const Params& p);
    ~SoundPlayer();

    SoundPlayer(const SoundPlayer&) = delete;
    SoundPlayer& operator=(const SoundPlayer&) = delete;

    // Fire-and-forget. Returns true if a player process was spawned.
    bool play(Cue cue);

    bool is_enabled() const { return p_.enabled; }
    std::string last_error() const;

    // Path played for a cue (exposed for diagnostics).
    std::string cue_path(Cue cue) const;

    static const char* cue_name(Cue cue);

private:
    void reap_locked(bool block);

    Params p_;
    mutable std::mutex m_;
    std::vector<pid_t> children_;
    std::string last_err_;
};
