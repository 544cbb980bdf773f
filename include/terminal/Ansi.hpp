#pragma once
#include <string>

// Escape sequences emitted by the renderer and the terminal ports.
// Only the small subset of VT100/xterm control functions the renderer
// relies on lives here.
namespace ansi {

inline constexpr const char* kClearScrollback  = "\x1b[3J";
inline constexpr const char* kClearScreen      = "\x1b[2J";
inline constexpr const char* kCursorHome       = "\x1b[H";
inline constexpr const char* kClearLine        = "\x1b[2K";
inline constexpr const char* kClearFromCursor  = "\x1b[J";
inline constexpr const char* kHideCursor       = "\x1b[?25l";
inline constexpr const char* kShowCursor       = "\x1b[?25h";
inline constexpr const char* kAltScreenEnter   = "\x1b[?1049h";
inline constexpr const char* kAltScreenLeave   = "\x1b[?1049l";
inline constexpr const char* kSyncBegin        = "\x1b[?2026h";
inline constexpr const char* kSyncEnd          = "\x1b[?2026l";
inline constexpr const char* kReset            = "\x1b[0m";

// Scrollback + screen + home, always issued as one group.
inline std::string fullClear() {
    return std::string(kClearScrollback) + kClearScreen + kCursorHome;
}

inline std::string cursorUp(int n) {
    return n > 0 ? "\x1b[" + std::to_string(n) + "A" : std::string();
}

inline std::string cursorDown(int n) {
    return n > 0 ? "\x1b[" + std::to_string(n) + "B" : std::string();
}

// Relative vertical move; positive is down.
inline std::string cursorMove(int deltaLines) {
    return deltaLines < 0 ? cursorUp(-deltaLines) : cursorDown(deltaLines);
}

inline std::string setTitle(const std::string& title) {
    return "\x1b]0;" + title + "\x07";
}

}  // namespace ansi
