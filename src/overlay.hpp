#pragma once

#include <string>

// Status indicator driven by controller transitions.
class Overlay {
public:
    enum class Indicator {
        Recording,
        Processing,
        Result,
        Notice,
        Error,
    };

    virtual ~Overlay() = default;

    virtual void show(Indicator what, const std::string& text = "") = 0;
    virtual void hide() = 0;
};

// Delivers confirmed text to whatever currently has keyboard focus.
class TextInserter {
public:
    virtual ~TextInserter() = default;

    // Throws QuillError(NoFocusTarget / InsertionFailed).
    virtual void insert(const std::string& text) = 0;
};
