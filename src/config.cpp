#include "config.hpp"

#include "chord.hpp"

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

static bool parse_int(const char* s, int& out) {
    try {
        size_t pos = 0;
        out = std::stoi(s, &pos);
        return pos == std::strlen(s);
    } catch (const std::logic_error&) {
        return false;
    }
}

static bool parse_double(const char* s, double& out) {
    try {
        size_t pos = 0;
        out = std::stod(s, &pos);
        return pos == std::strlen(s);
    } catch (const std::logic_error&) {
        return false;
    }
}

static bool parse_bool(const char* s, bool& out) {
    std::string v;
    for (const char* p = s; *p; ++p) v.push_back((char)std::tolower((unsigned char)*p));
    if (v == "1" || v == "true" || v == "yes" || v == "on")  { out = true;  return true; }
    if (v == "0" || v == "false" || v == "no" || v == "off") { out = false; return true; }
    return false;
}

static const char* env_or_null(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

bool quill_config_apply_env(QuillConfig& cfg, std::string& err) {
    if (const char* v = env_or_null("QUILL_MODEL"))     cfg.model = v;
    if (const char* v = env_or_null("QUILL_LANGUAGE"))  cfg.language = v;
    if (const char* v = env_or_null("QUILL_DEVICE"))    cfg.capture_device = v;
    if (const char* v = env_or_null("QUILL_SOUND_DIR")) cfg.sound_dir = v;
    if (const char* v = env_or_null("QUILL_HOTKEY"))    cfg.hotkey = v;
    if (const char* v = env_or_null("QUILL_SOUNDS")) {
        if (!parse_bool(v, cfg.play_sounds)) {
            err = std::string("QUILL_SOUNDS: expected on/off, got '") + v + "'";
            return false;
        }
    }
    return true;
}

ConfigStatus quill_config_parse_args(int argc, char** argv, QuillConfig& cfg, std::string& err) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto next_arg = [&]() -> const char* {
            if (++i >= argc) {
                err = "missing value for " + arg;
                return nullptr;
            }
            return argv[i];
        };
        auto bad_value = [&](const char* v) {
            err = "invalid value '" + std::string(v) + "' for " + arg;
            return ConfigStatus::Invalid;
        };

        if (arg == "-h" || arg == "--help") {
            return ConfigStatus::Help;
        }
        else if (arg == "-m" || arg == "--model")        { auto v = next_arg(); if (!v) return ConfigStatus::Invalid; cfg.model = v; }
        else if (arg == "-l" || arg == "--language")     { auto v = next_arg(); if (!v) return ConfigStatus::Invalid; cfg.language = v; }
        else if (arg == "-t" || arg == "--threads")      { auto v = next_arg(); if (!v) return ConfigStatus::Invalid; if (!parse_int(v, cfg.n_threads)) return bad_value(v); }
        else if (arg == "-ng" || arg == "--no-gpu")      { cfg.use_gpu = false; }
        else if (arg == "-d" || arg == "--device")       { auto v = next_arg(); if (!v) return ConfigStatus::Invalid; cfg.capture_device = v; }
        else if (               arg == "--sample-rate")  {
            auto v = next_arg(); if (!v) return ConfigStatus::Invalid;
            int sr = 0;
            if (!parse_int(v, sr) || sr <= 0) return bad_value(v);
            cfg.sample_rate = (unsigned)sr;
        }
        else if (               arg == "--min-secs")     { auto v = next_arg(); if (!v) return ConfigStatus::Invalid; if (!parse_double(v, cfg.min_recording_secs)) return bad_value(v); }
        else if (               arg == "--min-audio-secs") { auto v = next_arg(); if (!v) return ConfigStatus::Invalid; if (!parse_double(v, cfg.min_audio_secs)) return bad_value(v); }
        else if (               arg == "--vad-mode")     { auto v = next_arg(); if (!v) return ConfigStatus::Invalid; if (!parse_int(v, cfg.vad_mode)) return bad_value(v); }
        else if (               arg == "--hotkey")       { auto v = next_arg(); if (!v) return ConfigStatus::Invalid; cfg.hotkey = v; }
        else if (               arg == "--confirm-key")  { auto v = next_arg(); if (!v) return ConfigStatus::Invalid; cfg.confirm_key = v; }
        else if (               arg == "--cancel-key")   { auto v = next_arg(); if (!v) return ConfigStatus::Invalid; cfg.cancel_key = v; }
        else if (               arg == "--no-sounds")    { cfg.play_sounds = false; }
        else if (               arg == "--sound-dir")    { auto v = next_arg(); if (!v) return ConfigStatus::Invalid; cfg.sound_dir = v; }
        else if (               arg == "--sound-player") { auto v = next_arg(); if (!v) return ConfigStatus::Invalid; cfg.sound_player = v; }
        else if (               arg == "--sound-device") { auto v = next_arg(); if (!v) return ConfigStatus::Invalid; cfg.sound_device = v; }
        else if (               arg == "--no-color")     { cfg.color = false; }
        else {
            err = "unknown argument: " + arg;
            return ConfigStatus::Invalid;
        }
    }
    return ConfigStatus::Ok;
}

bool quill_config_validate(const QuillConfig& cfg, std::string& err) {
    if (cfg.model.empty()) {
        err = "no model given (use --model or QUILL_MODEL)";
        return false;
    }
    if (cfg.sample_rate == 0) {
        err = "sample rate must be positive";
        return false;
    }
    if (cfg.min_recording_secs < 0.0 || cfg.min_audio_secs < 0.0) {
        err = "durations must not be negative";
        return false;
    }
    if (cfg.n_threads < 1) {
        err = "threads must be at least 1";
        return false;
    }
    if (cfg.vad_mode < -1 || cfg.vad_mode > 3) {
        err = "vad mode must be -1 (off) or 0..3";
        return false;
    }
    if (cfg.language.empty()) {
        err = "language must be a code or 'auto'";
        return false;
    }

    try {
        KeyBinding hk = parse_key_binding(cfg.hotkey);
        if (hk.modifiers.empty()) {
            err = "hotkey '" + cfg.hotkey + "' must be a modifier+key chord";
            return false;
        }
        const KeyBinding confirm = parse_key_binding(cfg.confirm_key);
        const KeyBinding cancel = parse_key_binding(cfg.cancel_key);
        if (!confirm.modifiers.empty() || !cancel.modifiers.empty()) {
            err = "confirm and cancel must be single keys";
            return false;
        }
        if (confirm.key == cancel.key) {
            err = "confirm and cancel keys must differ";
            return false;
        }
    } catch (const std::invalid_argument& e) {
        err = e.what();
        return false;
    }
    return true;
}

ConfigStatus quill_config_load(int argc, char** argv, QuillConfig& cfg, std::string& err) {
    if (!quill_config_apply_env(cfg, err)) return ConfigStatus::Invalid;

    ConfigStatus st = quill_config_parse_args(argc, argv, cfg, err);
    if (st != ConfigStatus::Ok) return st;

    if (!quill_config_validate(cfg, err)) return ConfigStatus::Invalid;
    return ConfigStatus::Ok;
}

void quill_print_usage(std::FILE* out, const char* argv0, const QuillConfig& d) {
    std::fprintf(out, "\n");
    std::fprintf(out, "usage: %s [options]\n", argv0);
    std::fprintf(out, "\n");
    std::fprintf(out, "Hold the hotkey, speak, release. Confirm inserts the text, cancel drops it.\n");
    std::fprintf(out, "\n");
    std::fprintf(out, "options:\n");
    std::fprintf(out, "  -h,       --help               show this help message and exit\n");
    std::fprintf(out, "  -m FNAME, --model FNAME        ggml model path ($QUILL_MODEL)\n");
    std::fprintf(out, "  -l LANG,  --language LANG  [%-9s] spoken language or 'auto' ($QUILL_LANGUAGE)\n", d.language.c_str());
    std::fprintf(out, "  -t N,     --threads N      [%-9d] inference threads\n", d.n_threads);
    std::fprintf(out, "  -ng,      --no-gpu             disable GPU inference\n");
    std::fprintf(out, "  -d DEV,   --device DEV     [%-9s] ALSA capture device ($QUILL_DEVICE)\n", d.capture_device.c_str());
    std::fprintf(out, "            --sample-rate N  [%-9u] capture rate, Hz\n", d.sample_rate);
    std::fprintf(out, "            --min-secs N     [%-9.2f] shorter recordings are dropped\n", d.min_recording_secs);
    std::fprintf(out, "            --min-audio-secs N[%-8.2f] shorter audio is rejected as empty\n", d.min_audio_secs);
    std::fprintf(out, "            --vad-mode N     [%-9d] speech gate aggressiveness 0..3, -1 = off\n", d.vad_mode);
    std::fprintf(out, "            --hotkey KEY     [%-9s] push-to-talk chord ($QUILL_HOTKEY)\n", d.hotkey.c_str());
    std::fprintf(out, "            --confirm-key K  [%-9s] insert pending text\n", d.confirm_key.c_str());
    std::fprintf(out, "            --cancel-key K   [%-9s] discard recording or text\n", d.cancel_key.c_str());
    std::fprintf(out, "            --no-sounds          disable sound cues ($QUILL_SOUNDS=off)\n");
    std::fprintf(out, "            --sound-dir DIR  [%s] ($QUILL_SOUND_DIR)\n", d.sound_dir.c_str());
    std::fprintf(out, "            --sound-player B [%-9s] wav player binary\n", d.sound_player.c_str());
    std::fprintf(out, "            --sound-device D              ALSA output device for cues\n");
    std::fprintf(out, "            --no-color           plain status lines\n");
    std::fprintf(out, "\n");
}
