#pragma once
#include "Frame.hpp"
#include "TrackedState.hpp"
#include <vector>

enum class LineChange { Unchanged, Changed, Appended, Removed };

// Why positional (cursor-relative) comparison cannot be trusted
enum class BasisInvalidity {
    None,
    NoTrackedFrame,          // nothing committed yet, or state was discarded
    WidthChanged,            // every line may have re-wrapped
    ShrinkAfterIncremental,  // below the high-water mark without a fresh redraw
    AboveViewport            // first rewrite target scrolled into scrollback
};

const char* toString(BasisInvalidity reason);

struct DiffResult {
    std::vector<LineChange> lines;   // one entry per max(previous, desired) index

    int previousCount = 0;
    int desiredCount  = 0;

    int firstChanged = -1;           // first non-unchanged index, -1 if none
    int lastChanged  = -1;

    int changed  = 0;
    int appended = 0;
    int removed  = 0;

    bool hadTrackedFrame   = false;
    bool dimensionsChanged = false;  // width or height differ from tracked basis
    bool basisValid        = true;
    BasisInvalidity invalidity = BasisInvalidity::None;

    bool hasChanges() const { return firstChanged >= 0; }
    int touched() const { return changed + appended + removed; }

    // Changed and appended lines, merged into contiguous ranges
    std::vector<LineRange> rewriteRanges() const;

    // Trailing rows no longer covered by the desired frame
    LineRange removedRange() const { return {desiredCount, previousCount}; }
};

// Positional line diff between the tracked frame and the desired frame,
// plus the basis-validity verdict that gates incremental patching.
class FrameDiffer {
public:
    DiffResult diff(const TrackedState& tracked, const Frame& desired) const;
};
