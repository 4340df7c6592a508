#pragma once

#include "audio_capture.hpp"
#include "event_queue.hpp"
#include "overlay.hpp"
#include "recognizer.hpp"
#include "session.hpp"
#include "sound.hpp"
#include "state_machine.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/*
 * DictationController
 *
 * Owns the current Session and sequences capture, recognition, overlay and
 * insertion on a single consumer thread. Every other thread talks to it
 * through post().
 */

class DictationController {
public:
    struct Params {
        std::string language = "auto";
        double min_recording_secs = 0.3;

        // Error and notice indicators clear themselves after this long
        // while Idle. 0 keeps them until the next session.
        double notice_secs = 2.0;
    };

    DictationController(const Params& p,
                        AudioCapture& capture,
                        Recognizer& recognizer,
                        Overlay& overlay,
                        TextInserter& inserter,
                        SoundPlayer* sounds = nullptr);
    ~DictationController();

    DictationController(const DictationController&) = delete;
    DictationController& operator=(const DictationController&) = delete;

    // Start the recognition worker.
    void start();

    // Close any open session, stop the worker. Idempotent.
    void stop();

    // Thread-safe.
    void post(DictationEvent ev);

    // Handle at most one queued event. Returns false on timeout.
    bool process_next(std::chrono::milliseconds timeout);

    // Hide an error/notice indicator whose display time has passed.
    // process_next() calls this after every wait.
    void expire_notice(Clock::time_point now);

    // Consume events until `running` drops or a Shutdown event is handled.
    void run(const std::atomic<bool>& running);

    QuillStateMachine::State state() const { return sm_.state(); }
    void set_observer(QuillStateMachine::Observer obs) { sm_.set_observer(std::move(obs)); }

    bool has_session() const { return session_ != nullptr; }
    uint64_t session_id() const { return session_ ? session_->id : 0; }
    const std::string& pending_text() const { return pending_text_; }

private:
    struct RecognitionJob {
        uint64_t session_id = 0;
        std::vector<int16_t> pcm;
    };

    void handle(const DictationEvent& ev);

    void on_hotkey_down(const DictationEvent& ev);
    void on_hotkey_up(const DictationEvent& ev);
    void on_recognition_done(const DictationEvent& ev);
    void on_confirm();
    void on_cancel();
    void on_shutdown();

    void fail_session(ErrorKind kind, const std::string& detail);
    void show_transient(Overlay::Indicator what, const std::string& text);
    void close_capture();
    void cue(SoundPlayer::Cue c);

    void submit(RecognitionJob job);
    void worker_loop();

    Params p_;
    AudioCapture& capture_;
    Recognizer& recognizer_;
    Overlay& overlay_;
    TextInserter& inserter_;
    SoundPlayer* sounds_;

    QuillStateMachine sm_;
    EventQueue events_;

    std::unique_ptr<Session> session_;
    uint64_t next_session_id_ = 1;
    std::string pending_text_;

    bool notice_pending_ = false;
    Clock::time_point notice_until_;

    std::mutex jobs_m_;
    std::condition_variable jobs_cv_;
    std::deque<RecognitionJob> jobs_;
    bool worker_running_ = false;
    std::thread worker_;
};
