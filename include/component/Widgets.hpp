#pragma once
#include "Component.hpp"
#include <optional>
#include <string>

// Box-drawing character set
struct BorderStyle {
    std::string topLeft;
    std::string topRight;
    std::string bottomLeft;
    std::string bottomRight;
    std::string horizontal;
    std::string vertical;

    static const BorderStyle& sharp();    // ┌┐└┘
    static const BorderStyle& rounded();  // ╭╮╰╯
    static const BorderStyle& flat();     // horizontal rules only
};

// Multi-line text. Long lines are either wrapped or truncated with an
// ellipsis; output is memoized per width until the text changes.
class Text {
public:
    enum class Overflow { Wrap, Truncate };

    explicit Text(std::string text = "",
                  Overflow overflow = Overflow::Wrap,
                  int paddingX = 0,
                  std::string ellipsis = "…");

    void setText(std::string text);
    const std::string& text() const { return text_; }

    void setOverflow(Overflow overflow);
    Overflow overflow() const { return overflow_; }

    Lines render(int width);
    void invalidate() { cache_.reset(); }

private:
    struct Cache {
        int   width;
        Lines lines;
    };

    std::string text_;
    Overflow    overflow_;
    int         paddingX_;
    std::string ellipsis_;
    std::optional<Cache> cache_;
};

// Border around a set of content lines, with an optional title in the
// top edge. Content lines are truncated to the inner width.
class BorderedBox {
public:
    struct Options {
        const BorderStyle* style = &BorderStyle::sharp();
        std::string title;
        int paddingX = 1;
        std::string ellipsis = "…";
    };

    explicit BorderedBox(Lines content = {});
    BorderedBox(Lines content, Options options);

    void setContent(Lines content) { content_ = std::move(content); }
    const Lines& content() const { return content_; }

    void setTitle(std::string title) { options_.title = std::move(title); }

    Lines render(int width) const;
    void invalidate() {}

private:
    Lines   content_;
    Options options_;
};

// Vertical gap of empty lines
class Spacer {
public:
    explicit Spacer(int lines = 1) : lines_(lines) {}

    void setLines(int lines) { lines_ = lines; }

    Lines render(int) const { return Lines(lines_ > 0 ? lines_ : 0, std::string()); }
    void invalidate() {}

private:
    int lines_;
};
