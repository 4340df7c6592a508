#pragma once

#include "overlay.hpp"

#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <string>

// Status line on a terminal. With color on, each update rewrites the
// current line; without it, each update is a plain line.
class TerminalOverlay : public Overlay {
public:
    static constexpr std::size_t kMaxResultChars = 150;

    TerminalOverlay(std::ostream& out, bool color);

    void show(Indicator what, const std::string& text = "") override;
    void hide() override;

    bool visible() const;

    // Result text as displayed: first kMaxResultChars characters (UTF-8 code
    // points) plus "..." when longer.
    static std::string clip(const std::string& text);

private:
    void emit_locked(const char* color, const std::string& line);

    std::ostream& out_;
    bool color_;
    mutable std::mutex m_;
    bool visible_ = false;
};
