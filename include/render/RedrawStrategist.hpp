#pragma once
#include "Frame.hpp"
#include "FrameDiffer.hpp"
#include <vector>

struct RedrawDecision {
    enum class Kind { IncrementalPatch, FullRedraw };

    enum class Reason {
        NoChanges,
        Incremental,
        NoTrackedFrame,
        WidthChanged,
        ShrinkAfterIncremental,
        AboveViewport,
        DimensionsChanged,
        ChangeThreshold
    };

    Kind   kind   = Kind::FullRedraw;
    Reason reason = Reason::NoTrackedFrame;

    // Incremental patch only
    std::vector<LineRange> rewrite;   // changed + appended lines
    LineRange clear;                  // trailing rows to erase

    bool isFullRedraw() const { return kind == Kind::FullRedraw; }

    // An incremental patch that touches nothing
    bool isNoop() const {
        return kind == Kind::IncrementalPatch && rewrite.empty() && clear.empty();
    }
};

const char* toString(RedrawDecision::Kind kind);
const char* toString(RedrawDecision::Reason reason);

// Chooses between an incremental patch and a full redraw. Whenever a
// precondition of the patch cannot be established the full redraw wins.
class RedrawStrategist {
public:
    // `fullRedrawThreshold`: fraction of touched lines above which a full
    // redraw is preferred. Values >= 1 disable the heuristic.
    explicit RedrawStrategist(double fullRedrawThreshold = 1.0);

    RedrawDecision decide(const DiffResult& diff) const;

    double threshold() const { return threshold_; }

private:
    double threshold_;
};
