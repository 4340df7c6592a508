#pragma once

#include "audio_capture.hpp"
#include "errors.hpp"
#include "overlay.hpp"
#include "recognizer.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

class FakeCapture : public AudioCapture {
public:
    std::vector<int16_t> samples = std::vector<int16_t>(16000, 100);
    bool fail_start = false;
    int starts = 0;
    int stops = 0;

    void start() override {
        if (running_) throw std::logic_error("FakeCapture: start while running");
        if (fail_start) throw QuillError(ErrorKind::DeviceUnavailable, "no input device");
        running_ = true;
        starts++;
    }

    std::vector<int16_t> stop() override {
        if (!running_) throw std::logic_error("FakeCapture: stop without start");
        running_ = false;
        stops++;
        return samples;
    }

    bool running() const override { return running_; }

private:
    bool running_ = false;
};

// Runs on the controller's worker thread.
class FakeRecognizer : public Recognizer {
public:
    explicit FakeRecognizer(RecognitionResult reply = RecognitionResult::success("hello"))
        : reply_(std::move(reply)) {}

    RecognitionResult recognize(const std::vector<int16_t>& pcm,
                                const std::string& language) override {
        std::unique_lock<std::mutex> lk(m_);
        calls_++;
        sizes_.push_back(pcm.size());
        language_ = language;
        entered_cv_.notify_all();
        release_cv_.wait(lk, [&]{ return !hold_; });

        if (pcm.empty()) {
            return RecognitionResult::failure(ErrorKind::EmptyAudio, "zero samples");
        }
        return reply_;
    }

    void set_reply(RecognitionResult r) {
        std::lock_guard<std::mutex> lk(m_);
        reply_ = std::move(r);
    }

    // Block recognize() until release().
    void hold() {
        std::lock_guard<std::mutex> lk(m_);
        hold_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lk(m_);
            hold_ = false;
        }
        release_cv_.notify_all();
    }

    bool wait_entered(int n) {
        std::unique_lock<std::mutex> lk(m_);
        return entered_cv_.wait_for(lk, std::chrono::seconds(5), [&]{ return calls_ >= n; });
    }

    int calls() const {
        std::lock_guard<std::mutex> lk(m_);
        return calls_;
    }

    std::vector<std::size_t> sizes() const {
        std::lock_guard<std::mutex> lk(m_);
        return sizes_;
    }

    std::string language() const {
        std::lock_guard<std::mutex> lk(m_);
        return language_;
    }

private:
    mutable std::mutex m_;
    std::condition_variable entered_cv_;
    std::condition_variable release_cv_;
    RecognitionResult reply_;
    bool hold_ = false;
    int calls_ = 0;
    std::vector<std::size_t> sizes_;
    std::string language_;
};

class FakeOverlay : public Overlay {
public:
    struct Shown {
        Indicator what;
        std::string text;
    };

    std::vector<Shown> shown;
    int hides = 0;
    bool visible = false;

    void show(Indicator what, const std::string& text) override {
        shown.push_back({what, text});
        visible = true;
    }

    void hide() override {
        hides++;
        visible = false;
    }

    const Shown& last() const { return shown.back(); }
};

class FakeInserter : public TextInserter {
public:
    std::vector<std::string> inserted;
    ErrorKind fail_with = ErrorKind::None;

    void insert(const std::string& text) override {
        if (fail_with != ErrorKind::None) throw QuillError(fail_with, "fake insert failure");
        inserted.push_back(text);
    }
};
