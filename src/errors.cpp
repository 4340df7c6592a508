#include "errors.hpp"

const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::None:              return "None";
        case ErrorKind::DeviceUnavailable: return "DeviceUnavailable";
        case ErrorKind::EmptyAudio:        return "EmptyAudio";
        case ErrorKind::ModelUnavailable:  return "ModelUnavailable";
        case ErrorKind::InferenceError:    return "InferenceError";
        case ErrorKind::NoFocusTarget:     return "NoFocusTarget";
        case ErrorKind::InsertionFailed:   return "InsertionFailed";
        case ErrorKind::StrayEvent:        return "StrayEvent";
    }
    return "Unknown";
}

const char* error_kind_message(ErrorKind k) {
    switch (k) {
        case ErrorKind::None:              return "";
        case ErrorKind::DeviceUnavailable: return "Microphone unavailable";
        case ErrorKind::EmptyAudio:        return "No audio";
        case ErrorKind::ModelUnavailable:  return "Model unavailable";
        case ErrorKind::InferenceError:    return "Recognition failed";
        case ErrorKind::NoFocusTarget:     return "No focused window";
        case ErrorKind::InsertionFailed:   return "Insert failed";
        case ErrorKind::StrayEvent:        return "";
    }
    return "Error";
}
