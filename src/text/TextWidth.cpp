#include "text/TextWidth.hpp"
#include "terminal/Ansi.hpp"
#include <ftxui/screen/string.hpp>
#include <algorithm>

namespace text {

namespace {

constexpr const char* kHyperlinkClose = "\x1b]8;;\x07";
constexpr int kTabWidth = 3;

// Length of the escape sequence starting at s[i] (s[i] == ESC)
size_t escapeLength(std::string_view s, size_t i) {
    if (i + 1 >= s.size()) return 1;

    char kind = s[i + 1];
    if (kind == '[') {
        size_t j = i + 2;
        while (j < s.size() && !(s[j] >= 0x40 && s[j] <= 0x7e)) j++;
        return std::min(j + 1, s.size()) - i;
    }
    if (kind == ']') {
        // OSC: terminated by BEL or ST (ESC \)
        for (size_t j = i + 2; j < s.size(); j++) {
            if (s[j] == '\x07') return j + 1 - i;
            if (s[j] == '\x1b' && j + 1 < s.size() && s[j + 1] == '\\')
                return j + 2 - i;
        }
        return s.size() - i;
    }
    return 2;
}

bool isControl(char c) {
    auto u = static_cast<unsigned char>(c);
    return u < 0x20 || u == 0x7f;
}

void appendGlyphs(std::string_view run, std::vector<Token>& out) {
    if (run.empty()) return;
    for (auto& g : ftxui::Utf8ToGlyphs(std::string(run))) {
        if (g.empty()) continue;  // second cell of a wide glyph
        out.push_back({Token::Kind::Glyph, g, ftxui::string_width(g)});
    }
}

}  // namespace

bool Token::isSgr() const {
    return kind == Kind::Escape && text.size() >= 3 &&
           text[1] == '[' && text.back() == 'm';
}

bool Token::isHyperlink() const {
    return kind == Kind::Escape && text.compare(0, 4, "\x1b]8;") == 0;
}

std::vector<Token> tokenize(std::string_view s) {
    std::vector<Token> out;
    size_t runStart = 0;
    size_t i = 0;

    while (i < s.size()) {
        char c = s[i];
        if (c == '\x1b') {
            appendGlyphs(s.substr(runStart, i - runStart), out);
            size_t len = escapeLength(s, i);
            out.push_back({Token::Kind::Escape, std::string(s.substr(i, len)), 0});
            i += len;
            runStart = i;
        } else if (c == '\t') {
            appendGlyphs(s.substr(runStart, i - runStart), out);
            out.push_back({Token::Kind::Glyph, std::string(kTabWidth, ' '), kTabWidth});
            runStart = ++i;
        } else if (isControl(c)) {
            // Stray control bytes would move the real cursor; drop them
            appendGlyphs(s.substr(runStart, i - runStart), out);
            runStart = ++i;
        } else {
            i++;
        }
    }
    appendGlyphs(s.substr(runStart), out);
    return out;
}

int visibleWidth(std::string_view s) {
    int w = 0;
    for (auto& t : tokenize(s)) w += t.width;
    return w;
}

std::string stripAnsi(std::string_view s) {
    std::string out;
    for (auto& t : tokenize(s))
        if (t.kind == Token::Kind::Glyph) out += t.text;
    return out;
}

std::string sanitizeLine(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (auto& t : tokenize(s)) {
        if (t.kind == Token::Kind::Escape) {
            const auto& e = t.text;
            bool terminated = e.back() == '\x07' ||
                              (e.size() >= 2 && e.compare(e.size() - 2, 2, "\x1b\\") == 0);
            bool keep = t.isSgr() || (t.isHyperlink() && terminated);
            if (!keep) continue;  // cursor movement, erase, modes, truncated OSC
        }
        out += t.text;
    }
    return out;
}

std::string truncateToWidth(std::string_view s, int width,
                            std::string_view ellipsis) {
    if (width <= 0) return {};

    auto tokens = tokenize(s);
    int total = 0;
    for (auto& t : tokens) total += t.width;
    if (total <= width) return std::string(s);

    int ellipsisWidth = visibleWidth(ellipsis);
    if (ellipsisWidth > width) {
        ellipsis = {};
        ellipsisWidth = 0;
    }
    int target = width - ellipsisWidth;

    std::string out;
    int w = 0;
    bool styled = false;
    bool linkOpen = false;

    for (auto& t : tokens) {
        if (t.kind == Token::Kind::Escape) {
            out += t.text;
            styled = true;
            if (t.isHyperlink()) linkOpen = (t.text != kHyperlinkClose);
            continue;
        }
        if (w + t.width > target) break;
        out += t.text;
        w += t.width;
    }

    if (styled)   out += ansi::kReset;
    if (linkOpen) out += kHyperlinkClose;
    out += ellipsis;
    return out;
}

std::vector<std::string> wrapText(std::string_view s, int width) {
    width = std::max(width, 1);

    std::vector<std::string> lines;
    std::string active;  // SGR sequences in effect

    std::string cur;
    int curWidth = 0;

    std::vector<Token> word;
    int wordWidth = 0;
    std::vector<Token> spaces;
    int spaceWidth = 0;

    auto append = [&](const Token& t) {
        cur += t.text;
        curWidth += t.width;
        if (t.isSgr()) {
            if (t.text == "\x1b[0m" || t.text == "\x1b[m") active.clear();
            else active += t.text;
        }
    };

    auto breakLine = [&] {
        if (!active.empty()) cur += ansi::kReset;
        lines.push_back(cur);
        cur = active;
        curWidth = 0;
    };

    auto flushWord = [&] {
        if (word.empty()) return;

        if (wordWidth == 0) {
            // Escape-only run: keep the styling, not the pending spaces
            for (auto& t : word) append(t);
        } else if (curWidth + spaceWidth + wordWidth <= width) {
            for (auto& t : spaces) append(t);
            for (auto& t : word) append(t);
        } else {
            if (curWidth > 0) breakLine();
            for (auto& t : word) {
                if (t.width > 0 && curWidth + t.width > width && curWidth > 0)
                    breakLine();
                append(t);
            }
        }
        word.clear();
        wordWidth = 0;
        spaces.clear();
        spaceWidth = 0;
    };

    size_t start = 0;
    while (true) {
        size_t nl = s.find('\n', start);
        auto logical = s.substr(start, nl == std::string_view::npos
                                           ? std::string_view::npos
                                           : nl - start);

        for (auto& t : tokenize(logical)) {
            if (t.kind == Token::Kind::Glyph && t.text == " ") {
                flushWord();
                spaces.push_back(t);
                spaceWidth += t.width;
            } else {
                word.push_back(t);
                wordWidth += t.width;
            }
        }
        flushWord();
        spaces.clear();
        spaceWidth = 0;

        if (nl == std::string_view::npos) break;
        breakLine();
        start = nl + 1;
    }

    if (!active.empty()) cur += ansi::kReset;
    lines.push_back(cur);
    return lines;
}

std::string sliceColumns(std::string_view s, int start, int count) {
    std::string out;
    if (count <= 0) return out;

    int end = start + count;
    int col = 0;
    int outWidth = 0;

    for (auto& t : tokenize(s)) {
        if (t.kind == Token::Kind::Escape) {
            if (col < end) out += t.text;
            continue;
        }

        int gStart = col;
        int gEnd   = col + t.width;
        col = gEnd;

        if (gEnd <= start) continue;
        if (gStart >= end) break;

        if (gStart >= start && gEnd <= end) {
            out += t.text;
            outWidth += t.width;
        } else {
            // Wide glyph cut by the slice boundary
            int overlap = std::min(gEnd, end) - std::max(gStart, start);
            out.append(overlap, ' ');
            outWidth += overlap;
        }
    }

    if (outWidth < count) out.append(count - outWidth, ' ');
    return out;
}

std::string padToWidth(std::string_view s, int width) {
    std::string out(s);
    int w = visibleWidth(s);
    if (w < width) out.append(width - w, ' ');
    return out;
}

}  // namespace text
