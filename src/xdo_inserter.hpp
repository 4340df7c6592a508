// xdo_inserter.hpp
#pragma once

#include "overlay.hpp"

#include <string>

// Types text into the focused X11 window through libxdo.
class XdoInserter : public TextInserter {
public:
    struct Params {
        // Empty = $DISPLAY
        std::string display;

        // Delay between keystrokes, microseconds
        int type_delay_us = 12000;
    };

    // Throws std::runtime_error if the display cannot be opened.
    explicit XdoInserter(const Params& p);
    ~XdoInserter() override;

    XdoInserter(const XdoInserter&) = delete;
    XdoInserter& operator=(const XdoInserter&) = delete;

    void insert(const std::string& text) override;

private:
    struct Impl;
    Impl* impl_;
};
