#pragma once
#include <string>
#include <string_view>
#include <vector>

// ANSI-aware text measurement and shaping.
// CSI and OSC escape sequences occupy no cells, wide glyphs occupy two,
// tabs are expanded to three spaces.
namespace text {

struct Token {
    enum class Kind { Escape, Glyph } kind;
    std::string text;
    int width = 0;

    bool isSgr() const;        // ESC [ ... m
    bool isHyperlink() const;  // ESC ] 8 ; ...
};

// Split a line into escape sequences and glyphs (one glyph per cell group)
std::vector<Token> tokenize(std::string_view s);

int visibleWidth(std::string_view s);

std::string stripAnsi(std::string_view s);

// Longest prefix fitting in `width` cells followed by `ellipsis`.
// Returned unchanged when it already fits.
std::string truncateToWidth(std::string_view s, int width,
                            std::string_view ellipsis = "…");

// Word wrap to `width` cells. Embedded newlines force breaks, over-long
// words are split at glyph boundaries, SGR styles carry across breaks.
std::vector<std::string> wrapText(std::string_view s, int width);

// Cells [start, start + count) of a line, padded to exactly `count` cells
std::string sliceColumns(std::string_view s, int start, int count);

// Rebuild a line from its tokens so that its bytes occupy exactly
// visibleWidth() cells on one row: tabs become spaces, control bytes are
// dropped, and escapes other than SGR and OSC 8 hyperlinks are removed.
std::string sanitizeLine(std::string_view s);

// Right-pad with spaces to `width` cells (never truncates)
std::string padToWidth(std::string_view s, int width);

}  // namespace text
