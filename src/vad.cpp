// vad.cpp
#include "vad.hpp"

#include <fvad.h>

#include <stdexcept>
#include <string>

SpeechDetector::SpeechDetector(unsigned sample_rate, int mode, int frame_ms) {
    vad_ = fvad_new();
    if (!vad_) throw std::runtime_error("fvad_new failed");

    if (fvad_set_sample_rate(vad_, (int)sample_rate) != 0) {
        fvad_free(vad_);
        vad_ = nullptr;
        throw std::runtime_error("fvad_set_sample_rate(" + std::to_string(sample_rate) + ") failed");
    }
    if (fvad_set_mode(vad_, mode) != 0) {
        fvad_free(vad_);
        vad_ = nullptr;
        throw std::runtime_error("fvad_set_mode(" + std::to_string(mode) + ") failed");
    }

    frame_samples_ = (size_t)(sample_rate * (unsigned)frame_ms) / 1000;
}

SpeechDetector::~SpeechDetector() {
    if (vad_) fvad_free(vad_);
}

std::size_t SpeechDetector::voiced_frames(const std::vector<int16_t>& pcm) {
    fvad_reset(vad_);

    std::size_t voiced = 0;
    for (size_t off = 0; off + frame_samples_ <= pcm.size(); off += frame_samples_) {
        int is_speech = fvad_process(vad_, pcm.data() + off, frame_samples_);
        if (is_speech < 0) {
            throw std::runtime_error("fvad_process failed");
        }
        if (is_speech) voiced++;
    }
    return voiced;
}
