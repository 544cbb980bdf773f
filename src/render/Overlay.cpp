#include "render/Overlay.hpp"
#include "terminal/Ansi.hpp"
#include "text/TextWidth.hpp"
#include <algorithm>

OverlayStack::Handle OverlayStack::show(Component component, OverlayOptions options) {
    Handle h = nextHandle_++;
    entries_.push_back({h, std::move(component), options});
    return h;
}

bool OverlayStack::hide(Handle handle) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [handle](const Entry& e) { return e.handle == handle; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

int OverlayStack::composite(Lines& base, int width, int height,
                            const FrameBuilder& builder) const {
    int failures = 0;
    if (width <= 0 || height <= 0) return failures;

    for (auto& e : entries_) {
        const auto& o = e.options;

        int ow = o.width > 0 ? o.width : std::min(80, width - 4);
        ow = std::clamp(ow, 1, width);

        auto built = builder.build(e.component, ow, height);
        failures += built.failedComponents;
        auto& lines = built.frame.lines;

        int maxH = o.maxHeight > 0 ? std::min(o.maxHeight, height) : height;
        if (static_cast<int>(lines.size()) > maxH) lines.resize(maxH);
        int oh = static_cast<int>(lines.size());
        if (oh == 0) continue;

        int row = 0;
        switch (o.anchor) {
            case OverlayOptions::Anchor::Center: row = (height - oh) / 2; break;
            case OverlayOptions::Anchor::Top:    row = 0;                 break;
            case OverlayOptions::Anchor::Bottom: row = height - oh;       break;
        }
        row = std::clamp(row + o.rowOffset, 0, std::max(0, height - oh));
        int col = std::clamp((width - ow) / 2 + o.colOffset, 0, width - ow);

        int viewportStart = std::max(0, static_cast<int>(base.size()) - height);
        int top = viewportStart + row;
        if (static_cast<int>(base.size()) < top + oh)
            base.resize(top + oh);

        for (int i = 0; i < oh; i++)
            base[top + i] = spliceLine(base[top + i], lines[i], col, ow);
    }
    return failures;
}

std::string OverlayStack::spliceLine(const std::string& base,
                                     const std::string& overlay,
                                     int col, int overlayWidth) {
    bool styled = base.find('\x1b') != std::string::npos ||
                  overlay.find('\x1b') != std::string::npos;
    auto reset = styled ? std::string(ansi::kReset) : std::string();

    int baseWidth = text::visibleWidth(base);
    int rightStart = col + overlayWidth;

    std::string out = text::sliceColumns(base, 0, col);
    out += reset;
    out += text::padToWidth(overlay, overlayWidth);
    out += reset;
    if (baseWidth > rightStart)
        out += text::sliceColumns(base, rightStart, baseWidth - rightStart);
    return out;
}
