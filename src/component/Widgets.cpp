#include "component/Widgets.hpp"
#include "text/TextWidth.hpp"
#include <algorithm>

namespace {

std::string repeat(const std::string& s, int n) {
    std::string out;
    for (int i = 0; i < n; i++) out += s;
    return out;
}

}  // namespace

// ── BorderStyle ──────────────────────────────────────────────────────────

const BorderStyle& BorderStyle::sharp() {
    static const BorderStyle s{"┌", "┐", "└", "┘", "─", "│"};
    return s;
}

const BorderStyle& BorderStyle::rounded() {
    static const BorderStyle s{"╭", "╮", "╰", "╯", "─", "│"};
    return s;
}

const BorderStyle& BorderStyle::flat() {
    static const BorderStyle s{"─", "─", "─", "─", "─", " "};
    return s;
}

// ── Text ─────────────────────────────────────────────────────────────────

Text::Text(std::string text, Overflow overflow, int paddingX, std::string ellipsis)
    : text_(std::move(text))
    , overflow_(overflow)
    , paddingX_(std::max(0, paddingX))
    , ellipsis_(std::move(ellipsis)) {}

void Text::setText(std::string text) {
    if (text == text_) return;
    text_ = std::move(text);
    invalidate();
}

void Text::setOverflow(Overflow overflow) {
    if (overflow == overflow_) return;
    overflow_ = overflow;
    invalidate();
}

Lines Text::render(int width) {
    if (cache_ && cache_->width == width)
        return cache_->lines;

    Lines out;
    if (!text_.empty()) {
        int pad   = (width > paddingX_ * 2) ? paddingX_ : 0;
        int inner = width - pad * 2;
        std::string margin(pad, ' ');

        if (overflow_ == Overflow::Wrap) {
            for (auto& line : text::wrapText(text_, inner))
                out.push_back(margin + line);
        } else {
            size_t start = 0;
            while (true) {
                size_t nl = text_.find('\n', start);
                auto line = std::string_view(text_).substr(
                    start, nl == std::string::npos ? std::string::npos : nl - start);
                out.push_back(margin + text::truncateToWidth(line, inner, ellipsis_));
                if (nl == std::string::npos) break;
                start = nl + 1;
            }
        }
    }

    cache_ = Cache{width, out};
    return out;
}

// ── BorderedBox ──────────────────────────────────────────────────────────

BorderedBox::BorderedBox(Lines content)
    : BorderedBox(std::move(content), Options{}) {}

BorderedBox::BorderedBox(Lines content, Options options)
    : content_(std::move(content))
    , options_(std::move(options))
{
    if (!options_.style) options_.style = &BorderStyle::sharp();
    options_.paddingX = std::max(0, options_.paddingX);
}

Lines BorderedBox::render(int width) const {
    const auto& style = *options_.style;
    int innerWidth = width - 2 - options_.paddingX * 2;

    if (innerWidth < 1) {
        Lines bare;
        for (auto& line : content_)
            bare.push_back(text::truncateToWidth(line, width, options_.ellipsis));
        return bare;
    }

    Lines out;
    out.reserve(content_.size() + 2);

    // Top edge, with the title embedded after one horizontal cell
    if (!options_.title.empty() && width >= 6) {
        auto title = " " + text::truncateToWidth(options_.title, width - 5,
                                                 options_.ellipsis) + " ";
        int fill = width - 3 - text::visibleWidth(title);
        out.push_back(style.topLeft + style.horizontal + title +
                      repeat(style.horizontal, std::max(0, fill)) +
                      style.topRight);
    } else {
        out.push_back(style.topLeft + repeat(style.horizontal, width - 2) +
                      style.topRight);
    }

    std::string pad(options_.paddingX, ' ');
    for (auto& line : content_) {
        auto body = text::truncateToWidth(line, innerWidth, options_.ellipsis);
        out.push_back(style.vertical + pad + text::padToWidth(body, innerWidth) +
                      pad + style.vertical);
    }

    out.push_back(style.bottomLeft + repeat(style.horizontal, width - 2) +
                  style.bottomRight);
    return out;
}
