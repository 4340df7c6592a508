#pragma once

#include <cstdint>
#include <vector>

// Microphone boundary used by the dictation controller.
class AudioCapture {
public:
    virtual ~AudioCapture() = default;

    // Open the device and begin accumulating samples.
    // Throws QuillError(DeviceUnavailable) if the device cannot be opened.
    virtual void start() = 0;

    // Close the device and return everything captured since start().
    // Throws std::logic_error when not started.
    virtual std::vector<int16_t> stop() = 0;

    virtual bool running() const = 0;
};
