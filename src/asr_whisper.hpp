// asr_whisper.hpp
#pragma once

#include "recognizer.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

class WhisperASR : public Recognizer {
public:
    struct Params {
        // Model/backend behavior
        bool use_gpu = true;      // whisper.cpp: enables GPU if built with it

        // Performance/latency
        int  n_threads = 4;

        // Decoding / output behavior
        bool single_segment = false;
        bool no_context = true;

        // Input format; whisper only accepts 16 kHz.
        unsigned sample_rate = 16000;

        // Buffers shorter than this are EmptyAudio without touching the model.
        std::size_t min_samples = 1600;

        // fvad aggressiveness for the speech gate, -1 = gate off
        int vad_mode = 2;

        // Transcribe one second of silence at load time.
        bool warmup = true;

        // Shared object to dlopen; resolved through RPATH / LD_LIBRARY_PATH.
        std::string library = "libwhisper.so";
    };

    // Throws QuillError(ModelUnavailable) if the library or model cannot be
    // loaded.
    WhisperASR(const std::string& model_path, const Params& p);
    ~WhisperASR() override;

    WhisperASR(const WhisperASR&) = delete;
    WhisperASR& operator=(const WhisperASR&) = delete;

    // Output: trimmed transcript, or EmptyAudio / ModelUnavailable /
    // InferenceError.
    RecognitionResult recognize(const std::vector<int16_t>& pcm,
                                const std::string& language) override;

    // "auto" or a code known to the loaded model.
    bool language_supported(const std::string& language) const;

    bool warmed_up() const;

private:
    struct Impl;
    Impl* impl_;
};
