#pragma once

#include "errors.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

struct RecognitionResult {
    bool ok = false;
    std::string text;
    ErrorKind error = ErrorKind::None;
    std::string detail;

    static RecognitionResult success(std::string text) {
        RecognitionResult r;
        r.ok = true;
        r.text = std::move(text);
        return r;
    }

    static RecognitionResult failure(ErrorKind kind, std::string detail) {
        RecognitionResult r;
        r.error = kind;
        r.detail = std::move(detail);
        return r;
    }
};

// Speech-to-text boundary. Called from the recognition worker thread only.
class Recognizer {
public:
    virtual ~Recognizer() = default;

    // Input: 16-bit mono PCM at the configured sample rate.
    virtual RecognitionResult recognize(const std::vector<int16_t>& pcm,
                                        const std::string& language) = 0;
};
