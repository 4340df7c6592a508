#include "dictation.hpp"

#include <cstdio>
#include <exception>
#include <stdexcept>
#include <utility>

DictationController::DictationController(const Params& p,
                                         AudioCapture& capture,
                                         Recognizer& recognizer,
                                         Overlay& overlay,
                                         TextInserter& inserter,
                                         SoundPlayer* sounds)
    : p_(p),
      capture_(capture),
      recognizer_(recognizer),
      overlay_(overlay),
      inserter_(inserter),
      sounds_(sounds) {}

DictationController::~DictationController() {
    stop();
}

void DictationController::start() {
    std::lock_guard<std::mutex> lk(jobs_m_);
    if (worker_running_) return;
    worker_running_ = true;
    worker_ = std::thread([this]{ worker_loop(); });
}

void DictationController::stop() {
    // Runs on the consumer thread (or after it has exited).
    if (sm_.state() != QuillStateMachine::State::Shutdown) {
        on_shutdown();
    }

    {
        std::lock_guard<std::mutex> lk(jobs_m_);
        worker_running_ = false;
        jobs_.clear();
    }
    jobs_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void DictationController::post(DictationEvent ev) {
    events_.push(std::move(ev));
}

bool DictationController::process_next(std::chrono::milliseconds timeout) {
    DictationEvent ev;
    const bool got = events_.pop(ev, timeout);
    if (got) handle(ev);
    expire_notice(Clock::now());
    return got;
}

void DictationController::expire_notice(Clock::time_point now) {
    if (!notice_pending_ || now < notice_until_) return;
    notice_pending_ = false;
    if (sm_.state() == QuillStateMachine::State::Idle) overlay_.hide();
}

void DictationController::run(const std::atomic<bool>& running) {
    while (running.load() && sm_.state() != QuillStateMachine::State::Shutdown) {
        process_next(std::chrono::milliseconds(100));
    }
}

void DictationController::handle(const DictationEvent& ev) {
    if (sm_.state() == QuillStateMachine::State::Shutdown) return;

    switch (ev.kind) {
        case DictationEvent::Kind::HotkeyDown:      on_hotkey_down(ev); break;
        case DictationEvent::Kind::HotkeyUp:        on_hotkey_up(ev); break;
        case DictationEvent::Kind::RecognitionDone: on_recognition_done(ev); break;
        case DictationEvent::Kind::Confirm:         on_confirm(); break;
        case DictationEvent::Kind::Cancel:          on_cancel(); break;
        case DictationEvent::Kind::Shutdown:        on_shutdown(); break;
    }
}

/* ===================== Transitions ===================== */

void DictationController::on_hotkey_down(const DictationEvent& ev) {
    // Only Idle accepts it: key repeats while Recording and presses while a
    // result is pending are dropped by the table.
    if (!sm_.dispatch(QuillStateMachine::Event::HotkeyDown)) return;

    session_.reset(new Session);
    session_->id = next_session_id_++;
    session_->started_at = ev.at;

    try {
        capture_.start();
    } catch (const QuillError& e) {
        fail_session(e.kind(), e.what());
        return;
    }

    notice_pending_ = false;
    std::fprintf(stderr, "[dictation] session %llu recording\n",
                 (unsigned long long)session_->id);
    overlay_.show(Overlay::Indicator::Recording);
    cue(SoundPlayer::Cue::Start);
}

void DictationController::on_hotkey_up(const DictationEvent& ev) {
    if (sm_.state() != QuillStateMachine::State::Recording || !session_) return;

    const double secs = std::chrono::duration<double>(ev.at - session_->started_at).count();

    if (secs < p_.min_recording_secs) {
        close_capture();
        session_.reset();

        char note[64];
        std::snprintf(note, sizeof(note), "%.2fs < %.2fs", secs, p_.min_recording_secs);
        sm_.dispatch(QuillStateMachine::Event::TooShort, note);

        cue(SoundPlayer::Cue::Stop);
        show_transient(Overlay::Indicator::Notice, "Too short");
        return;
    }

    std::vector<int16_t> pcm = capture_.stop();
    session_->samples = pcm.size();
    session_->frozen = true;

    char note[64];
    std::snprintf(note, sizeof(note), "secs=%.2f samples=%zu", secs, pcm.size());
    sm_.dispatch(QuillStateMachine::Event::HotkeyUp, note);

    overlay_.show(Overlay::Indicator::Processing);
    cue(SoundPlayer::Cue::Stop);

    RecognitionJob job;
    job.session_id = session_->id;
    job.pcm = std::move(pcm);
    submit(std::move(job));
}

void DictationController::on_recognition_done(const DictationEvent& ev) {
    if (sm_.state() != QuillStateMachine::State::Processing ||
        !session_ || session_->id != ev.session_id) {
        std::fprintf(stderr, "[dictation] dropping stale result for session %llu\n",
                     (unsigned long long)ev.session_id);
        return;
    }

    const RecognitionResult& r = ev.result;
    if (!r.ok) {
        fail_session(r.error == ErrorKind::None ? ErrorKind::InferenceError : r.error, r.detail);
        return;
    }
    if (r.text.empty()) {
        fail_session(ErrorKind::EmptyAudio, "empty transcript");
        return;
    }

    pending_text_ = r.text;
    sm_.dispatch(QuillStateMachine::Event::Recognized);
    overlay_.show(Overlay::Indicator::Result, pending_text_);
}

void DictationController::on_confirm() {
    if (!sm_.dispatch(QuillStateMachine::Event::Confirm)) return;

    std::string text = std::move(pending_text_);
    pending_text_.clear();
    session_.reset();

    // Hide first so focus is back on the target window when typing starts.
    overlay_.hide();

    try {
        inserter_.insert(text);
        std::fprintf(stderr, "[insert] %zu bytes\n", text.size());
        cue(SoundPlayer::Cue::Success);
    } catch (const QuillError& e) {
        std::fprintf(stderr, "[insert] %s: %s\n", error_kind_name(e.kind()), e.what());
        show_transient(Overlay::Indicator::Error, error_kind_message(e.kind()));
        cue(SoundPlayer::Cue::Error);
    }

    sm_.dispatch(QuillStateMachine::Event::Done);
}

void DictationController::on_cancel() {
    if (!sm_.dispatch(QuillStateMachine::Event::Cancel)) return;

    close_capture();
    session_.reset();
    pending_text_.clear();
    overlay_.hide();

    sm_.dispatch(QuillStateMachine::Event::Done);
}

void DictationController::on_shutdown() {
    notice_pending_ = false;
    close_capture();
    session_.reset();
    pending_text_.clear();
    overlay_.hide();

    sm_.dispatch(QuillStateMachine::Event::Stop, "shutdown");
    events_.close();
}

/* ===================== Helpers ===================== */

void DictationController::fail_session(ErrorKind kind, const std::string& detail) {
    std::fprintf(stderr, "[dictation] session %llu failed: %s%s%s\n",
                 (unsigned long long)session_id(),
                 error_kind_name(kind),
                 detail.empty() ? "" : " : ",
                 detail.c_str());

    close_capture();
    session_.reset();
    pending_text_.clear();

    sm_.dispatch(QuillStateMachine::Event::Fail, error_kind_name(kind));

    show_transient(Overlay::Indicator::Error, error_kind_message(kind));
    cue(SoundPlayer::Cue::Error);
}

void DictationController::show_transient(Overlay::Indicator what, const std::string& text) {
    overlay_.show(what, text);
    if (p_.notice_secs > 0.0) {
        notice_pending_ = true;
        notice_until_ = Clock::now() +
            std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(p_.notice_secs));
    }
}

void DictationController::close_capture() {
    if (!capture_.running()) return;
    std::vector<int16_t> discarded = capture_.stop();
    std::fprintf(stderr, "[audio] discarded %zu samples\n", discarded.size());
}

void DictationController::cue(SoundPlayer::Cue c) {
    if (sounds_) sounds_->play(c);
}

/* ===================== Recognition worker ===================== */

void DictationController::submit(RecognitionJob job) {
    {
        std::lock_guard<std::mutex> lk(jobs_m_);
        if (!worker_running_) {
            throw std::logic_error("DictationController: recognition submitted before start()");
        }
        jobs_.emplace_back(std::move(job));
    }
    jobs_cv_.notify_one();
}

void DictationController::worker_loop() {
    while (true) {
        RecognitionJob job;

        {
            std::unique_lock<std::mutex> lk(jobs_m_);
            jobs_cv_.wait(lk, [&]{ return !worker_running_ || !jobs_.empty(); });

            if (!worker_running_) break;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        auto asr0 = Clock::now();
        RecognitionResult r;
        try {
            r = recognizer_.recognize(job.pcm, p_.language);
        } catch (const QuillError& e) {
            r = RecognitionResult::failure(e.kind(), e.what());
        } catch (const std::exception& e) {
            r = RecognitionResult::failure(ErrorKind::InferenceError, e.what());
        }
        auto asr1 = Clock::now();

        std::fprintf(stderr, "[perf] asr_ms=%lld ok=%d\n",
                     (long long)std::chrono::duration_cast<std::chrono::milliseconds>(asr1 - asr0).count(),
                     r.ok ? 1 : 0);
        std::fflush(stderr);

        events_.push(DictationEvent::recognized(job.session_id, std::move(r)));
    }
}
