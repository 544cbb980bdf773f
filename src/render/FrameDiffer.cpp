#include "render/FrameDiffer.hpp"
#include <algorithm>

const char* toString(BasisInvalidity reason) {
    switch (reason) {
        case BasisInvalidity::None:                   return "valid";
        case BasisInvalidity::NoTrackedFrame:         return "no tracked frame";
        case BasisInvalidity::WidthChanged:           return "width changed";
        case BasisInvalidity::ShrinkAfterIncremental: return "shrink after incremental frame";
        case BasisInvalidity::AboveViewport:          return "change above viewport";
    }
    return "unknown";
}

std::vector<LineRange> DiffResult::rewriteRanges() const {
    std::vector<LineRange> ranges;
    for (int i = 0; i < static_cast<int>(lines.size()); i++) {
        auto c = lines[i];
        if (c != LineChange::Changed && c != LineChange::Appended) continue;

        if (!ranges.empty() && ranges.back().end == i)
            ranges.back().end = i + 1;
        else
            ranges.push_back({i, i + 1});
    }
    return ranges;
}

DiffResult FrameDiffer::diff(const TrackedState& tracked, const Frame& desired) const {
    DiffResult d;
    const auto& prev = tracked.frame.lines;

    d.hadTrackedFrame = tracked.valid;
    d.previousCount   = tracked.valid ? static_cast<int>(prev.size()) : 0;
    d.desiredCount    = desired.size();

    int overlap = std::min(d.previousCount, d.desiredCount);
    int total   = std::max(d.previousCount, d.desiredCount);
    d.lines.resize(total, LineChange::Unchanged);

    for (int i = 0; i < overlap; i++) {
        if (prev[i] != desired.lines[i]) {
            d.lines[i] = LineChange::Changed;
            d.changed++;
        }
    }
    for (int i = overlap; i < total; i++) {
        if (d.desiredCount > d.previousCount) {
            d.lines[i] = LineChange::Appended;
            d.appended++;
        } else {
            d.lines[i] = LineChange::Removed;
            d.removed++;
        }
    }

    for (int i = 0; i < total; i++) {
        if (d.lines[i] == LineChange::Unchanged) continue;
        if (d.firstChanged < 0) d.firstChanged = i;
        d.lastChanged = i;
    }

    // ── Basis validity ───────────────────────────────────────────────────
    auto invalidate = [&](BasisInvalidity why) {
        d.basisValid = false;
        d.invalidity = why;
    };

    if (!tracked.valid) {
        invalidate(BasisInvalidity::NoTrackedFrame);
        return d;
    }

    const auto& was = tracked.frame.basis;
    const auto& now = desired.basis;
    d.dimensionsChanged = !was.sameDimensions(now);

    if (was.width != now.width) {
        invalidate(BasisInvalidity::WidthChanged);
    } else if (d.desiredCount < tracked.maxLinesRendered && !tracked.justRedrawn()) {
        // The region grew past this size and shrank again while the cursor
        // was only tracked relatively; row offsets are no longer provable.
        invalidate(BasisInvalidity::ShrinkAfterIncremental);
    } else if (d.hasChanges() && d.firstChanged < tracked.viewportTop()) {
        invalidate(BasisInvalidity::AboveViewport);
    }
    return d;
}
