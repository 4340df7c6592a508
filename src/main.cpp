// main.cpp
#include "alsa_capture.hpp"
#include "asr_whisper.hpp"
#include "chord.hpp"
#include "config.hpp"
#include "dictation.hpp"
#include "keyboard.hpp"
#include "sound.hpp"
#include "state_machine.hpp"
#include "terminal_overlay.hpp"
#include "xdo_inserter.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include <unistd.h>

static void die(const std::string& msg) {
    std::fprintf(stderr, "quill: %s\n", msg.c_str());
    std::exit(1);
}

static std::atomic<bool> g_running{true};
static void on_signal(int) { g_running.store(false); }

static void print_banner(const QuillConfig& cfg) {
    std::fprintf(stderr, "\n");
    std::fprintf(stderr, "quill:\n");
    std::fprintf(stderr, "  model    = %s\n", cfg.model.c_str());
    std::fprintf(stderr, "  language = %s\n", cfg.language.c_str());
    std::fprintf(stderr, "  threads  = %d\n", cfg.n_threads);
    std::fprintf(stderr, "  device   = %s @ %u Hz\n", cfg.capture_device.c_str(), cfg.sample_rate);
    std::fprintf(stderr, "  hotkey   = %s (confirm %s, cancel %s)\n",
                 cfg.hotkey.c_str(), cfg.confirm_key.c_str(), cfg.cancel_key.c_str());
    std::fprintf(stderr, "  min rec  = %.2fs\n", cfg.min_recording_secs);
    std::fprintf(stderr, "  sounds   = %s\n", cfg.play_sounds ? cfg.sound_dir.c_str() : "off");
    std::fprintf(stderr, "\n");
}

int main(int argc, char** argv) {
    /* ===================== Config ===================== */
    QuillConfig cfg;
    std::string err;
    switch (quill_config_load(argc, argv, cfg, err)) {
        case ConfigStatus::Ok:
            break;
        case ConfigStatus::Help:
            quill_print_usage(stdout, argv[0], QuillConfig{});
            return 0;
        case ConfigStatus::Invalid:
            std::fprintf(stderr, "error: %s\n", err.c_str());
            quill_print_usage(stderr, argv[0], QuillConfig{});
            return 1;
    }

    print_banner(cfg);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    /* ===================== Startup checks ===================== */
    AlsaCapture::Params cap_p;
    cap_p.device = cfg.capture_device;
    cap_p.sample_rate = cfg.sample_rate;
    if (!AlsaCapture::probe(cap_p, err)) {
        die("microphone unavailable: " + err);
    }
    std::fprintf(stderr, "[audio] %s OK\n", cfg.capture_device.c_str());

    WhisperASR::Params asr_p;
    asr_p.use_gpu = cfg.use_gpu;
    asr_p.n_threads = cfg.n_threads;
    asr_p.sample_rate = cfg.sample_rate;
    asr_p.min_samples = (std::size_t)(cfg.min_audio_secs * cfg.sample_rate);
    asr_p.vad_mode = cfg.vad_mode;

    std::unique_ptr<WhisperASR> asr;
    try {
        std::fprintf(stderr, "[asr] loading %s ...\n", cfg.model.c_str());
        asr.reset(new WhisperASR(cfg.model, asr_p));
    } catch (const QuillError& e) {
        die(std::string("model unavailable: ") + e.what());
    }
    if (!asr->language_supported(cfg.language)) {
        die("unknown language '" + cfg.language + "'");
    }
    std::fprintf(stderr, "[asr] ready\n");

    std::unique_ptr<XdoInserter> inserter;
    try {
        inserter.reset(new XdoInserter(XdoInserter::Params{}));
    } catch (const std::runtime_error& e) {
        die(e.what());
    }

    /* ===================== Components ===================== */
    AlsaCapture capture(cap_p);

    const bool color = cfg.color && ::isatty(STDOUT_FILENO);
    TerminalOverlay overlay(std::cout, color);

    SoundPlayer::Params snd_p;
    snd_p.enabled = cfg.play_sounds;
    snd_p.sound_dir = cfg.sound_dir;
    snd_p.player_bin = cfg.sound_player;
    snd_p.out_device = cfg.sound_device;
    SoundPlayer sounds(snd_p);

    DictationController::Params dc_p;
    dc_p.language = cfg.language;
    dc_p.min_recording_secs = cfg.min_recording_secs;
    DictationController dictation(dc_p, capture, *asr, overlay, *inserter, &sounds);

    dictation.set_observer([](QuillStateMachine::State from,
                              QuillStateMachine::State to,
                              QuillStateMachine::Event why,
                              const std::string& note) {
        std::fprintf(stderr, "[SM] %s --(%s)--> %s%s%s\n",
                     QuillStateMachine::state_name(from),
                     QuillStateMachine::event_name(why),
                     QuillStateMachine::state_name(to),
                     note.empty() ? "" : " : ",
                     note.empty() ? "" : note.c_str());
    });

    /* ===================== Keys ===================== */
    KeyboardListener::Params kb_p;
    kb_p.keys.hotkey = parse_key_binding(cfg.hotkey);
    kb_p.keys.confirm_key = parse_key_binding(cfg.confirm_key).key;
    kb_p.keys.cancel_key = parse_key_binding(cfg.cancel_key).key;

    KeyboardListener keys(kb_p, [&dictation](ChordTracker::Action a) {
        switch (a) {
            case ChordTracker::Action::HotkeyDown:
                dictation.post(DictationEvent::key(DictationEvent::Kind::HotkeyDown));
                break;
            case ChordTracker::Action::HotkeyUp:
                dictation.post(DictationEvent::key(DictationEvent::Kind::HotkeyUp));
                break;
            case ChordTracker::Action::Confirm:
                dictation.post(DictationEvent::key(DictationEvent::Kind::Confirm));
                break;
            case ChordTracker::Action::Cancel:
                dictation.post(DictationEvent::key(DictationEvent::Kind::Cancel));
                break;
        }
    });

    try {
        keys.start();
    } catch (const std::runtime_error& e) {
        die(std::string("keyboard: ") + e.what());
    }

    /* ===================== Event loop ===================== */
    dictation.start();

    std::fprintf(stderr, "Ready. Hold %s and speak (Ctrl-C to quit) ...\n", cfg.hotkey.c_str());

    dictation.run(g_running);

    std::fprintf(stderr, "\nStopping...\n");

    keys.stop();
    dictation.stop();

    return 0;
}
