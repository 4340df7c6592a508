// vad.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

struct Fvad;

// WebRTC VAD over a finished recording. Used to reject silent takes before
// they reach the model.
class SpeechDetector {
public:
    // mode: 0..3, higher = more aggressive. Throws std::runtime_error if
    // libfvad rejects the sample rate or mode.
    SpeechDetector(unsigned sample_rate, int mode, int frame_ms = 20);
    ~SpeechDetector();

    SpeechDetector(const SpeechDetector&) = delete;
    SpeechDetector& operator=(const SpeechDetector&) = delete;

    // Number of frames classified as speech. A trailing partial frame is
    // not classified.
    std::size_t voiced_frames(const std::vector<int16_t>& pcm);

private:
    Fvad* vad_ = nullptr;
    std::size_t frame_samples_ = 0;
};
