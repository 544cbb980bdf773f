#pragma once
#include "FrameBuilder.hpp"
#include "component/Component.hpp"
#include <vector>

struct OverlayOptions {
    enum class Anchor { Center, Top, Bottom };

    int    width     = 0;   // 0 = min(80, columns - 4)
    int    maxHeight = 0;   // 0 = viewport height
    Anchor anchor    = Anchor::Center;
    int    rowOffset = 0;
    int    colOffset = 0;
};

// Component trees drawn on top of the frame, inside the visible viewport
// (the last `height` lines). Composited in the order they were shown.
class OverlayStack {
public:
    using Handle = int;

    Handle show(Component component, OverlayOptions options = {});
    bool hide(Handle handle);
    void clear() { entries_.clear(); }

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }

    // Splice every overlay into `base`. Returns the number of overlay
    // components that failed to render.
    int composite(Lines& base, int width, int height,
                  const FrameBuilder& builder) const;

    // One base line with `overlay` occupying cells [col, col + overlayWidth)
    static std::string spliceLine(const std::string& base,
                                  const std::string& overlay,
                                  int col, int overlayWidth);

private:
    struct Entry {
        Handle         handle;
        Component      component;
        OverlayOptions options;
    };

    std::vector<Entry> entries_;
    Handle nextHandle_ = 1;
};
