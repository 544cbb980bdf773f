#include "render/RedrawStrategist.hpp"
#include <algorithm>

const char* toString(RedrawDecision::Kind kind) {
    switch (kind) {
        case RedrawDecision::Kind::IncrementalPatch: return "incremental";
        case RedrawDecision::Kind::FullRedraw:       return "full";
    }
    return "unknown";
}

const char* toString(RedrawDecision::Reason reason) {
    switch (reason) {
        case RedrawDecision::Reason::NoChanges:              return "no changes";
        case RedrawDecision::Reason::Incremental:            return "incremental";
        case RedrawDecision::Reason::NoTrackedFrame:         return "no tracked frame";
        case RedrawDecision::Reason::WidthChanged:           return "width changed";
        case RedrawDecision::Reason::ShrinkAfterIncremental: return "shrink after incremental frame";
        case RedrawDecision::Reason::AboveViewport:          return "change above viewport";
        case RedrawDecision::Reason::DimensionsChanged:      return "dimensions changed";
        case RedrawDecision::Reason::ChangeThreshold:        return "change threshold exceeded";
    }
    return "unknown";
}

namespace {

RedrawDecision::Reason reasonFor(BasisInvalidity why) {
    switch (why) {
        case BasisInvalidity::NoTrackedFrame:         return RedrawDecision::Reason::NoTrackedFrame;
        case BasisInvalidity::WidthChanged:           return RedrawDecision::Reason::WidthChanged;
        case BasisInvalidity::ShrinkAfterIncremental: return RedrawDecision::Reason::ShrinkAfterIncremental;
        case BasisInvalidity::AboveViewport:          return RedrawDecision::Reason::AboveViewport;
        case BasisInvalidity::None:                   break;
    }
    return RedrawDecision::Reason::NoTrackedFrame;
}

RedrawDecision fullRedraw(RedrawDecision::Reason reason) {
    RedrawDecision d;
    d.kind   = RedrawDecision::Kind::FullRedraw;
    d.reason = reason;
    return d;
}

}  // namespace

RedrawStrategist::RedrawStrategist(double fullRedrawThreshold)
    : threshold_(std::clamp(fullRedrawThreshold, 0.0, 1.0)) {}

RedrawDecision RedrawStrategist::decide(const DiffResult& diff) const {
    // Nothing to write: no cursor-relative write can land on a wrong row
    if (diff.hadTrackedFrame && !diff.dimensionsChanged && !diff.hasChanges()) {
        RedrawDecision d;
        d.kind   = RedrawDecision::Kind::IncrementalPatch;
        d.reason = RedrawDecision::Reason::NoChanges;
        return d;
    }

    if (!diff.basisValid)
        return fullRedraw(reasonFor(diff.invalidity));

    if (diff.dimensionsChanged)
        return fullRedraw(RedrawDecision::Reason::DimensionsChanged);

    if (threshold_ < 1.0) {
        int span = std::max(diff.previousCount, diff.desiredCount);
        if (span > 0 && static_cast<double>(diff.touched()) / span > threshold_)
            return fullRedraw(RedrawDecision::Reason::ChangeThreshold);
    }

    RedrawDecision d;
    d.kind    = RedrawDecision::Kind::IncrementalPatch;
    d.reason  = RedrawDecision::Reason::Incremental;
    d.rewrite = diff.rewriteRanges();
    d.clear   = diff.removedRange();
    return d;
}
