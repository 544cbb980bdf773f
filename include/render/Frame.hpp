#pragma once
#include <string>
#include <vector>

// Terminal context a frame was computed under
struct Basis {
    int width     = 0;
    int height    = 0;
    int lineCount = 0;

    bool sameDimensions(const Basis& o) const {
        return width == o.width && height == o.height;
    }
};

// One render pass worth of display lines. Every line fits in basis.width.
struct Frame {
    std::vector<std::string> lines;
    Basis basis;

    int size() const { return static_cast<int>(lines.size()); }
    bool empty() const { return lines.empty(); }
};

// Half-open range of line indices [begin, end)
struct LineRange {
    int begin = 0;
    int end   = 0;

    int size() const { return end > begin ? end - begin : 0; }
    bool empty() const { return end <= begin; }

    bool operator==(const LineRange& o) const {
        return begin == o.begin && end == o.end;
    }
};
