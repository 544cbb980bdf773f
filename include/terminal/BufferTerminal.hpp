#pragma once
#include "ITerminal.hpp"
#include "Ansi.hpp"
#include <numeric>
#include <string>
#include <vector>

// In-memory terminal port that records every write.
// Used by the tests and by the demo's headless mode.
class BufferTerminal : public ITerminal {
public:
    BufferTerminal(int columns = 80, int rows = 24)
        : columns_(columns), rows_(rows) {}

    void write(const std::string& bytes) override { writes_.push_back(bytes); }

    int columns() const override { return columns_; }
    int rows() const override { return rows_; }

    void moveCursorBy(int deltaLines) override { write(ansi::cursorMove(deltaLines)); }
    void clearLine() override { write(std::string("\r") + ansi::kClearLine); }
    void clearFromCursor() override { write(ansi::kClearFromCursor); }
    void clearScreen() override { write(ansi::fullClear()); }

    void hideCursor() override { write(ansi::kHideCursor); }
    void showCursor() override { write(ansi::kShowCursor); }

    void enterAlternateScreen() override { write(ansi::kAltScreenEnter); }
    void leaveAlternateScreen() override { write(ansi::kAltScreenLeave); }

    void setTitle(const std::string& title) override { write(ansi::setTitle(title)); }

    // Change dimensions and notify like a SIGWINCH would
    void resize(int columns, int rows) {
        columns_ = columns;
        rows_    = rows;
        if (onResize) onResize();
    }

    const std::vector<std::string>& writes() const { return writes_; }

    std::string lastWrite() const {
        return writes_.empty() ? std::string() : writes_.back();
    }

    // Everything written so far, concatenated
    std::string output() const {
        return std::accumulate(writes_.begin(), writes_.end(), std::string());
    }

    size_t bytesWritten() const {
        size_t n = 0;
        for (auto& w : writes_) n += w.size();
        return n;
    }

    void clearRecording() { writes_.clear(); }

private:
    int columns_;
    int rows_;
    std::vector<std::string> writes_;
};
