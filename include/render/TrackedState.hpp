#pragma once
#include "Frame.hpp"
#include <cstdint>

// The renderer's belief about what the terminal shows. Replaced as a whole
// after every render; never patched in place.
struct TrackedState {
    Frame frame;                    // last committed frame and its basis
    int   cursorRow = 0;            // cursor row relative to frame line 0
    int   maxLinesRendered = 0;     // high-water mark since the last full redraw
    std::uint64_t epoch = 0;        // bumped on every full redraw
    int   framesSinceFullRedraw = 0;
    bool  valid = false;            // false until a frame is committed

    bool justRedrawn() const { return valid && framesSinceFullRedraw == 0; }

    // First frame line still on screen; lines above it are in scrollback
    int viewportTop() const {
        int top = maxLinesRendered - frame.basis.height;
        return top > 0 ? top : 0;
    }

    // Forget everything; the next render will be a full redraw
    void reset() { *this = TrackedState{}; }
};
