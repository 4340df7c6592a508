#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    None,
    DeviceUnavailable,
    EmptyAudio,
    ModelUnavailable,
    InferenceError,
    NoFocusTarget,
    InsertionFailed,
    StrayEvent,
};

// Runtime failure raised by the capture/recognition/insertion adapters.
// Terminal to the current session only.
class QuillError : public std::runtime_error {
public:
    QuillError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

const char* error_kind_name(ErrorKind k);

// Short user-facing message for the overlay.
const char* error_kind_message(ErrorKind k);
