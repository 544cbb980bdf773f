#pragma once
#include "FrameBuilder.hpp"
#include "FrameDiffer.hpp"
#include "OutputEmitter.hpp"
#include "Overlay.hpp"
#include "RedrawStrategist.hpp"
#include "RenderStats.hpp"
#include "RendererConfig.hpp"
#include "TrackedState.hpp"
#include "component/Component.hpp"
#include "terminal/ITerminal.hpp"

// Differential renderer: owns the component tree, the tracked terminal
// state and the terminal port. Single-threaded; one render runs to
// completion before the next starts.
class Renderer {
public:
    explicit Renderer(ITerminal& terminal, RendererConfig config = {});
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    // Terminal modes on/off (cursor, alternate screen, title, resize hook)
    void start();
    void stop();
    bool isStarted() const { return started_; }

    // Component tree
    void addChild(Component child);
    Container& root() { return *root_.asContainer(); }

    // Overlays; both request a render
    OverlayStack::Handle showOverlay(Component component, OverlayOptions options = {});
    bool hideOverlay(OverlayStack::Handle handle);
    bool hasOverlays() const { return !overlays_.empty(); }

    // Mark a render as pending. Requests coalesce until flush().
    // `force` drops the tracked state so the next render is a full redraw.
    void requestRender(bool force = false);
    bool renderPending() const { return renderRequested_; }

    // Run the pending render, if any. Returns true if a frame was rendered.
    bool flush();

    // Render now. Called while a render is already running (e.g. from a
    // component), it only marks a render as pending.
    // Propagates TerminalWriteError after discarding the tracked state.
    void render();

    // Resize notification; coalesced like any other request
    void onResize() { requestRender(); }

    int fullRedraws() const { return static_cast<int>(stats_.fullRedraws); }
    const RenderStats& stats() const { return stats_; }
    const TrackedState& trackedState() const { return state_; }
    const RendererConfig& config() const { return config_; }

private:
    ITerminal&       terminal_;
    RendererConfig   config_;
    Component        root_;
    OverlayStack     overlays_;

    FrameBuilder     builder_;
    FrameDiffer      differ_;
    RedrawStrategist strategist_;
    OutputEmitter    emitter_;

    TrackedState     state_;
    RenderStats      stats_;

    bool started_         = false;
    bool renderRequested_ = false;
    bool rendering_       = false;
};
