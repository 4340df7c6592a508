#pragma once

#include <cstdio>
#include <string>

// Process-wide settings, loaded once before the event loop.
struct QuillConfig {
    // recognition
    std::string model;                  // ggml model path (required)
    std::string language      = "auto"; // code or "auto"
    int         n_threads     = 4;
    bool        use_gpu       = true;
    double      min_audio_secs = 0.1;   // shorter buffers are EmptyAudio
    int         vad_mode      = 2;      // -1 disables the speech gate

    // audio
    std::string capture_device = "default";
    unsigned    sample_rate    = 16000;

    // interaction
    double      min_recording_secs = 0.3;
    std::string hotkey      = "alt+space";
    std::string confirm_key = "space";
    std::string cancel_key  = "esc";

    // feedback
    bool        play_sounds = true;
    std::string sound_dir   = "/usr/share/quill/sounds";
    std::string sound_player = "aplay";
    std::string sound_device;           // empty = player default
    bool        color        = true;    // only honoured on a TTY
};

enum class ConfigStatus {
    Ok,
    Help,
    Invalid,
};

// QUILL_MODEL, QUILL_LANGUAGE, QUILL_DEVICE, QUILL_SOUND_DIR, QUILL_SOUNDS,
// QUILL_HOTKEY. Returns false (with err) on an unparsable value.
bool quill_config_apply_env(QuillConfig& cfg, std::string& err);

// Command line flags override whatever the environment set.
ConfigStatus quill_config_parse_args(int argc, char** argv, QuillConfig& cfg, std::string& err);

// Cross-field checks: required model, ranges, parsable keys.
bool quill_config_validate(const QuillConfig& cfg, std::string& err);

// env + args + validate, in that order.
ConfigStatus quill_config_load(int argc, char** argv, QuillConfig& cfg, std::string& err);

void quill_print_usage(std::FILE* out, const char* argv0, const QuillConfig& defaults);
