#include "render/OutputEmitter.hpp"
#include "terminal/Ansi.hpp"
#include <algorithm>

namespace {

// Tracks the cursor while composing a patch. Rows below `extent` exist on
// screen already; reaching past it has to create rows with newlines.
class CursorWriter {
public:
    CursorWriter(std::string& buf, int row, int extent)
        : buf_(buf), row_(row), extent_(std::max(extent, 1)) {}

    // Column 0 of `target`, never recomputed from an absolute position
    void moveTo(int target) {
        if (target < row_) {
            buf_ += ansi::cursorUp(row_ - target);
            buf_ += '\r';
        } else if (target == row_) {
            buf_ += '\r';
        } else {
            int existing = std::min(target, extent_ - 1);
            if (existing - row_ > 1) {
                buf_ += ansi::cursorDown(existing - row_);
                buf_ += '\r';
                row_ = existing;
            }
            while (row_ < target) {
                buf_ += "\r\n";
                row_++;
            }
        }
        row_ = target;
        extent_ = std::max(extent_, target + 1);
    }

    int row() const { return row_; }

private:
    std::string& buf_;
    int row_;
    int extent_;
};

}  // namespace

OutputEmitter::OutputEmitter()
    : OutputEmitter(Options{}) {}

OutputEmitter::OutputEmitter(Options options)
    : options_(options) {}

void OutputEmitter::appendLine(std::string& buf, const std::string& line) {
    buf += ansi::kClearLine;
    buf += line;
    if (line.find('\x1b') != std::string::npos)
        buf += ansi::kReset;
}

OutputEmitter::Emission OutputEmitter::compose(const RedrawDecision& decision,
                                               const Frame& desired,
                                               const TrackedState& tracked) const {
    auto e = decision.isFullRedraw() ? composeFull(desired, tracked)
                                     : composePatch(decision, desired, tracked);

    if (options_.synchronizedOutput && !e.bytes.empty())
        e.bytes = ansi::kSyncBegin + e.bytes + ansi::kSyncEnd;
    return e;
}

OutputEmitter::Emission OutputEmitter::emit(const RedrawDecision& decision,
                                            const Frame& desired,
                                            const TrackedState& tracked,
                                            ITerminal& terminal) const {
    auto e = compose(decision, desired, tracked);
    if (!e.bytes.empty())
        terminal.write(e.bytes);
    return e;
}

// ── Full redraw ──────────────────────────────────────────────────────────

OutputEmitter::Emission OutputEmitter::composeFull(const Frame& desired,
                                                   const TrackedState& tracked) const {
    Emission e;
    auto& buf = e.bytes;

    buf += ansi::fullClear();
    for (int i = 0; i < desired.size(); i++) {
        if (i > 0) buf += "\r\n";
        appendLine(buf, desired.lines[i]);
    }

    auto& s = e.state;
    s.frame                 = desired;
    s.cursorRow             = std::max(0, desired.size() - 1);
    s.maxLinesRendered      = desired.size();
    s.epoch                 = tracked.epoch + 1;
    s.framesSinceFullRedraw = 0;
    s.valid                 = true;
    return e;
}

// ── Incremental patch ────────────────────────────────────────────────────

OutputEmitter::Emission OutputEmitter::composePatch(const RedrawDecision& decision,
                                                    const Frame& desired,
                                                    const TrackedState& tracked) const {
    Emission e;
    e.state = tracked;
    e.state.frame = desired;

    // Nothing moved, nothing written: the bookkeeping is untouched
    if (decision.isNoop())
        return e;

    auto& buf = e.bytes;
    CursorWriter cursor(buf, tracked.cursorRow, tracked.maxLinesRendered);

    for (auto& range : decision.rewrite) {
        for (int i = range.begin; i < range.end; i++) {
            cursor.moveTo(i);
            appendLine(buf, desired.lines[i]);
        }
    }

    for (int i = decision.clear.begin; i < decision.clear.end; i++) {
        cursor.moveTo(i);
        buf += ansi::kClearLine;
    }

    // Park on the last line so appends continue from there
    int last = std::max(0, desired.size() - 1);
    if (cursor.row() != last)
        cursor.moveTo(last);

    auto& s = e.state;
    s.cursorRow        = last;
    s.maxLinesRendered = std::max(tracked.maxLinesRendered, desired.size());
    s.framesSinceFullRedraw = tracked.framesSinceFullRedraw + 1;
    s.valid            = true;
    return e;
}
