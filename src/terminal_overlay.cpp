#include "terminal_overlay.hpp"

#include <ostream>

static constexpr const char* COLOR_RESET  = "\033[0m";
static constexpr const char* COLOR_REC    = "\033[1;31m"; // bright red
static constexpr const char* COLOR_BUSY   = "\033[1;33m"; // bright yellow
static constexpr const char* COLOR_RESULT = "\033[1;32m"; // bright green
static constexpr const char* COLOR_HINT   = "\033[2m";    // dim
static constexpr const char* CLEAR_LINE   = "\r\033[2K";

TerminalOverlay::TerminalOverlay(std::ostream& out, bool color)
    : out_(out), color_(color) {}

bool TerminalOverlay::visible() const {
    std::lock_guard<std::mutex> lk(m_);
    return visible_;
}

std::string TerminalOverlay::clip(const std::string& text) {
    // Count UTF-8 code points; continuation bytes (10xxxxxx) do not start one.
    std::size_t chars = 0;
    for (std::size_t i = 0; i < text.size(); i++) {
        if (((unsigned char)text[i] & 0xC0) == 0x80) continue;
        if (chars == kMaxResultChars) return text.substr(0, i) + "...";
        chars++;
    }
    return text;
}

void TerminalOverlay::emit_locked(const char* color, const std::string& line) {
    if (color_) {
        out_ << CLEAR_LINE << color << line << COLOR_RESET;
    } else {
        out_ << line << '\n';
    }
    out_.flush();
    visible_ = true;
}

void TerminalOverlay::show(Indicator what, const std::string& text) {
    std::lock_guard<std::mutex> lk(m_);

    const std::string hint_sep = color_ ? std::string(COLOR_RESET) + COLOR_HINT : "";

    switch (what) {
        case Indicator::Recording:
            emit_locked(COLOR_REC, "* Recording  " + hint_sep + "Release to stop | Esc - cancel");
            break;
        case Indicator::Processing:
            emit_locked(COLOR_BUSY, "* Processing...");
            break;
        case Indicator::Result:
            emit_locked(COLOR_RESULT, clip(text) + "  " + hint_sep + "Space - insert | Esc - cancel");
            break;
        case Indicator::Notice:
            emit_locked(COLOR_BUSY, text);
            break;
        case Indicator::Error:
            emit_locked(COLOR_REC, "! " + text);
            break;
    }
}

void TerminalOverlay::hide() {
    std::lock_guard<std::mutex> lk(m_);
    if (!visible_) return;
    if (color_) {
        out_ << CLEAR_LINE;
        out_.flush();
    }
    visible_ = false;
}
