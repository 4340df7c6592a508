// alsa_capture.hpp
#pragma once

#include "audio_capture.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class AlsaCapture : public AudioCapture {
public:
    struct Params {
        std::string device = "default";
        unsigned sample_rate = 16000;
        int frame_ms = 20;

        // Preallocation hint for one recording.
        int expected_secs = 10;
    };

    explicit AlsaCapture(const Params& p);
    ~AlsaCapture() override;

    AlsaCapture(const AlsaCapture&) = delete;
    AlsaCapture& operator=(const AlsaCapture&) = delete;

    void start() override;
    std::vector<int16_t> stop() override;
    bool running() const override { return running_.load(); }

    // Open and close the device once. Returns false (and fills err) if the
    // device is unavailable.
    static bool probe(const Params& p, std::string& err);

private:
    struct Impl;

    void reader_loop();

    Params p_;
    Impl* impl_;

    std::atomic<bool> running_{false};
    std::atomic<bool> reading_{false};
    std::thread reader_;

    std::mutex buf_m_;
    std::vector<int16_t> buf_;
};
