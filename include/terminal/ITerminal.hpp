#pragma once
#include <functional>
#include <string>

// Abstract terminal port. The renderer reaches the device only through it.
// Implementations: ProcessTerminal (stdout), BufferTerminal (in-memory).
class ITerminal {
public:
    virtual ~ITerminal() = default;

    // Raw output. Throws TerminalWriteError when the bytes cannot be written.
    virtual void write(const std::string& bytes) = 0;

    // Current dimensions in cells
    virtual int columns() const = 0;
    virtual int rows() const = 0;

    // Cursor and erase primitives
    virtual void moveCursorBy(int deltaLines) = 0;
    virtual void clearLine() = 0;
    virtual void clearFromCursor() = 0;
    virtual void clearScreen() = 0;     // including scrollback

    virtual void hideCursor() = 0;
    virtual void showCursor() = 0;

    virtual void enterAlternateScreen() = 0;
    virtual void leaveAlternateScreen() = 0;

    virtual void setTitle(const std::string& title) = 0;

    // Fired when the terminal dimensions change
    std::function<void()> onResize;
};
