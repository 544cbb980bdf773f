#pragma once
#include "ITerminal.hpp"
#include <termios.h>

// Terminal port backed by the controlling TTY of the process (stdout/stdin).
// Dimensions come from ftxui's terminal query and are refreshed on SIGWINCH.
class ProcessTerminal : public ITerminal {
public:
    explicit ProcessTerminal(int outFd = 1, int inFd = 0);
    ~ProcessTerminal() override;

    ProcessTerminal(const ProcessTerminal&) = delete;
    ProcessTerminal& operator=(const ProcessTerminal&) = delete;

    void write(const std::string& bytes) override;

    int columns() const override { return columns_; }
    int rows() const override { return rows_; }

    void moveCursorBy(int deltaLines) override;
    void clearLine() override;
    void clearFromCursor() override;
    void clearScreen() override;

    void hideCursor() override;
    void showCursor() override;

    void enterAlternateScreen() override;
    void leaveAlternateScreen() override;

    void setTitle(const std::string& title) override;

    // Raw input mode (no echo, no line buffering). Restored by
    // disableRawMode() or on destruction.
    bool enableRawMode();
    void disableRawMode();

    // Deliver a pending SIGWINCH to onResize. Several signals between two
    // polls collapse into one notification. Returns true if one was pending.
    bool pollResize();

    // Re-query the terminal size
    void refreshSize();

private:
    int outFd_;
    int inFd_;
    int columns_ = 80;
    int rows_    = 24;

    bool rawMode_ = false;
    ::termios savedTermios_{};
};
