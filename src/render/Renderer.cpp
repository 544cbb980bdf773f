#include "render/Renderer.hpp"
#include "terminal/TerminalError.hpp"
#include <spdlog/spdlog.h>

namespace {

// Clears the in-progress flag however the render exits
struct RenderGuard {
    bool& flag;
    explicit RenderGuard(bool& f) : flag(f) { flag = true; }
    ~RenderGuard() { flag = false; }
};

}  // namespace

Renderer::Renderer(ITerminal& terminal, RendererConfig config)
    : terminal_(terminal)
    , config_(std::move(config))
    , root_(Container("root"))
    , builder_(config_.ellipsis)
    , strategist_(config_.fullRedrawThreshold)
    , emitter_(OutputEmitter::Options{config_.synchronizedOutput})
{
}

Renderer::~Renderer() {
    try {
        stop();
    } catch (const std::exception& e) {
        spdlog::error("Renderer shutdown failed: {}", e.what());
    }
}

void Renderer::start() {
    if (started_) return;

    if (config_.alternateScreen) terminal_.enterAlternateScreen();
    if (config_.hideCursor)      terminal_.hideCursor();
    if (!config_.title.empty())  terminal_.setTitle(config_.title);

    terminal_.onResize = [this] { onResize(); };
    started_ = true;

    spdlog::debug("Renderer started ({}x{})", terminal_.columns(), terminal_.rows());
    requestRender(true);
}

void Renderer::stop() {
    if (!started_) return;
    started_ = false;
    terminal_.onResize = nullptr;

    // Leave the cursor on the line below the rendered region
    if (state_.valid && !state_.frame.empty()) {
        int delta = (state_.frame.size() - 1) - state_.cursorRow;
        if (delta != 0) terminal_.moveCursorBy(delta);
        terminal_.write("\r\n");
    }
    state_.reset();

    if (config_.hideCursor)      terminal_.showCursor();
    if (config_.alternateScreen) terminal_.leaveAlternateScreen();

    spdlog::debug("Renderer stopped after {} frames ({} full redraws)",
                  stats_.frames, stats_.fullRedraws);
}

void Renderer::addChild(Component child) {
    root().add(std::move(child));
    requestRender();
}

OverlayStack::Handle Renderer::showOverlay(Component component, OverlayOptions options) {
    auto h = overlays_.show(std::move(component), options);
    requestRender();
    return h;
}

bool Renderer::hideOverlay(OverlayStack::Handle handle) {
    if (!overlays_.hide(handle)) return false;
    requestRender();
    return true;
}

void Renderer::requestRender(bool force) {
    if (force) state_.reset();
    renderRequested_ = true;
}

bool Renderer::flush() {
    if (!renderRequested_ || rendering_) return false;
    render();
    return true;
}

void Renderer::render() {
    if (rendering_) {
        renderRequested_ = true;
        return;
    }
    RenderGuard guard(rendering_);
    renderRequested_ = false;

    int width  = terminal_.columns();
    int height = terminal_.rows();

    auto built = builder_.build(root_, width, height);
    if (!overlays_.empty()) {
        built.failedComponents +=
            overlays_.composite(built.frame.lines, width, height, builder_);
        built.frame.basis.lineCount = built.frame.size();
    }

    auto diff     = differ_.diff(state_, built.frame);
    auto decision = strategist_.decide(diff);

    OutputEmitter::Emission emission;
    try {
        emission = emitter_.emit(decision, built.frame, state_, terminal_);
    } catch (const TerminalWriteError& e) {
        // Unknown how much reached the terminal; only a full redraw can recover
        state_.reset();
        spdlog::error("Terminal write failed during render: {}", e.what());
        throw;
    }
    state_ = std::move(emission.state);

    stats_.frames++;
    stats_.bytesWritten    += emission.bytes.size();
    stats_.componentErrors += built.failedComponents;
    stats_.lastDecision     = toString(decision.kind);
    stats_.lastReason       = toString(decision.reason);
    if (decision.isFullRedraw()) {
        stats_.fullRedraws++;
    } else {
        stats_.incrementalPatches++;
        if (decision.isNoop()) stats_.noopFrames++;
    }

    spdlog::debug("Render #{}: {} ({}), {} -> {} lines, {} bytes",
                  stats_.frames, stats_.lastDecision, stats_.lastReason,
                  diff.previousCount, diff.desiredCount, emission.bytes.size());
}
