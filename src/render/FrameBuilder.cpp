#include "render/FrameBuilder.hpp"
#include "terminal/Ansi.hpp"
#include "text/TextWidth.hpp"
#include <spdlog/spdlog.h>

FrameBuilder::FrameBuilder(std::string ellipsis)
    : ellipsis_(std::move(ellipsis)) {}

FrameBuilder::Result FrameBuilder::build(const Component& root,
                                         int width, int height) const {
    Result r;
    renderNode(root, width, r.frame.lines, r.failedComponents);
    r.frame.basis = {width, height, r.frame.size()};
    return r;
}

void FrameBuilder::renderNode(const Component& node, int width,
                              Lines& out, int& failures) const {
    if (auto leaf = node.asLeaf()) {
        renderLeaf(*leaf, width, out, failures);
        return;
    }
    for (auto& child : node.asContainer()->children())
        renderNode(child, width, out, failures);
}

void FrameBuilder::renderLeaf(const Leaf& leaf, int width,
                              Lines& out, int& failures) const {
    try {
        auto lines = leaf.render(width);
        for (size_t i = 0; i < lines.size(); i++) {
            // Bytes sent to the terminal must not move the cursor by themselves
            lines[i] = text::sanitizeLine(lines[i]);
            int w = text::visibleWidth(lines[i]);
            if (w > width) {
                throw ComponentRenderError(
                    "line " + std::to_string(i) + " is " + std::to_string(w) +
                    " cells wide, limit " + std::to_string(width));
            }
        }
        out.insert(out.end(), std::make_move_iterator(lines.begin()),
                   std::make_move_iterator(lines.end()));
    } catch (const std::exception& e) {
        failures++;
        spdlog::warn("Component '{}' failed to render: {}", leaf.name(), e.what());
        out.push_back(placeholder(leaf.name(), e.what(), width));
    } catch (...) {
        failures++;
        spdlog::warn("Component '{}' failed to render: unknown error", leaf.name());
        out.push_back(placeholder(leaf.name(), "unknown error", width));
    }
}

std::string FrameBuilder::placeholder(const std::string& name,
                                      const std::string& what, int width) const {
    auto msg = text::truncateToWidth(
        text::sanitizeLine("[render error in " + name + ": " + what + "]"),
        width, ellipsis_);
    return "\x1b[31m" + msg + ansi::kReset;
}
