#include <gtest/gtest.h>
#include "render/OutputEmitter.hpp"
#include "terminal/Ansi.hpp"
#include "terminal/BufferTerminal.hpp"
#include "VirtualScreen.hpp"

namespace {

Frame makeFrame(Lines lines, int width = 20, int height = 6) {
    Frame f;
    f.lines = std::move(lines);
    f.basis = {width, height, f.size()};
    return f;
}

RedrawDecision fullRedraw() {
    RedrawDecision d;
    d.kind   = RedrawDecision::Kind::FullRedraw;
    d.reason = RedrawDecision::Reason::NoTrackedFrame;
    return d;
}

RedrawDecision patch(std::vector<LineRange> rewrite, LineRange clear = {}) {
    RedrawDecision d;
    d.kind    = RedrawDecision::Kind::IncrementalPatch;
    d.reason  = RedrawDecision::Reason::Incremental;
    d.rewrite = std::move(rewrite);
    d.clear   = clear;
    return d;
}

OutputEmitter plainEmitter() {
    OutputEmitter::Options o;
    o.synchronizedOutput = false;
    return OutputEmitter(o);
}

}  // namespace

TEST(OutputEmitterTest, FullRedrawClearsThenWritesEveryLine) {
    auto emitter = plainEmitter();
    auto e = emitter.compose(fullRedraw(), makeFrame({"a", "b"}), TrackedState{});

    EXPECT_EQ(e.bytes, ansi::fullClear() + "\x1b[2Ka\r\n\x1b[2Kb");
    EXPECT_TRUE(e.state.valid);
    EXPECT_EQ(e.state.cursorRow, 1);
    EXPECT_EQ(e.state.maxLinesRendered, 2);
    EXPECT_EQ(e.state.epoch, 1u);
    EXPECT_EQ(e.state.framesSinceFullRedraw, 0);
}

TEST(OutputEmitterTest, FullRedrawBumpsEpoch) {
    auto emitter = plainEmitter();
    TrackedState s;
    s.epoch = 7;
    auto e = emitter.compose(fullRedraw(), makeFrame({"x"}), s);
    EXPECT_EQ(e.state.epoch, 8u);
}

TEST(OutputEmitterTest, SynchronizedOutputWrapsFrame) {
    OutputEmitter emitter;
    auto e = emitter.compose(fullRedraw(), makeFrame({"a"}), TrackedState{});

    EXPECT_EQ(e.bytes.rfind(ansi::kSyncBegin, 0), 0u);
    EXPECT_EQ(e.bytes.substr(e.bytes.size() - std::string(ansi::kSyncEnd).size()),
              ansi::kSyncEnd);
}

TEST(OutputEmitterTest, StyledLinesAreReset) {
    auto emitter = plainEmitter();
    auto e = emitter.compose(fullRedraw(), makeFrame({"\x1b[31mred", "plain"}),
                             TrackedState{});

    EXPECT_NE(e.bytes.find("\x1b[31mred\x1b[0m"), std::string::npos);
    EXPECT_EQ(e.bytes.find("plain\x1b[0m"), std::string::npos);
}

TEST(OutputEmitterTest, NoopPatchWritesNothing) {
    auto emitter = plainEmitter();
    BufferTerminal term(20, 6);
    auto first = emitter.emit(fullRedraw(), makeFrame({"a", "b"}), TrackedState{}, term);
    term.clearRecording();

    auto e = emitter.emit(patch({}), makeFrame({"a", "b"}), first.state, term);

    EXPECT_TRUE(e.bytes.empty());
    EXPECT_TRUE(term.writes().empty());
    EXPECT_EQ(e.state.cursorRow, first.state.cursorRow);
    EXPECT_EQ(e.state.framesSinceFullRedraw, 0);
    EXPECT_EQ(e.state.epoch, first.state.epoch);
}

TEST(OutputEmitterTest, PatchRewritesChangedLineOnly) {
    auto emitter = plainEmitter();
    auto first = emitter.compose(fullRedraw(), makeFrame({"a", "b", "c"}), TrackedState{});

    auto e = emitter.compose(patch({{1, 2}}), makeFrame({"a", "B", "c"}), first.state);

    EXPECT_EQ(e.bytes, "\x1b[1A\r\x1b[2KB\r\n");
    EXPECT_EQ(e.state.cursorRow, 2);
    EXPECT_EQ(e.state.maxLinesRendered, 3);
    EXPECT_EQ(e.state.framesSinceFullRedraw, 1);
    EXPECT_EQ(e.state.epoch, first.state.epoch);

    VirtualScreen screen(20, 6);
    screen.feed(first.bytes);
    screen.feed(e.bytes);
    auto visible = screen.visibleLines();
    EXPECT_EQ(visible[0], "a");
    EXPECT_EQ(visible[1], "B");
    EXPECT_EQ(visible[2], "c");
    EXPECT_EQ(screen.cursorRow(), 2);
}

TEST(OutputEmitterTest, AppendCreatesRowsWithNewlines) {
    auto emitter = plainEmitter();
    auto first = emitter.compose(fullRedraw(), makeFrame({"a"}), TrackedState{});

    auto e = emitter.compose(patch({{1, 3}}), makeFrame({"a", "b", "c"}), first.state);

    EXPECT_EQ(e.bytes, "\r\n\x1b[2Kb\r\n\x1b[2Kc");
    EXPECT_EQ(e.state.cursorRow, 2);
    EXPECT_EQ(e.state.maxLinesRendered, 3);
}

TEST(OutputEmitterTest, ShrinkClearsTrailingRows) {
    auto emitter = plainEmitter();
    auto first = emitter.compose(fullRedraw(), makeFrame({"a", "b", "c"}), TrackedState{});

    auto e = emitter.compose(patch({}, {1, 3}), makeFrame({"a"}), first.state);

    EXPECT_EQ(e.state.cursorRow, 0);
    EXPECT_EQ(e.state.maxLinesRendered, 3);

    VirtualScreen screen(20, 6);
    screen.feed(first.bytes);
    screen.feed(e.bytes);
    auto visible = screen.visibleLines();
    EXPECT_EQ(visible[0], "a");
    EXPECT_EQ(visible[1], "");
    EXPECT_EQ(visible[2], "");
    EXPECT_EQ(screen.cursorRow(), 0);
}

TEST(OutputEmitterTest, FrameIsOneWrite) {
    OutputEmitter emitter;
    BufferTerminal term(20, 6);
    auto first = emitter.emit(fullRedraw(), makeFrame({"a", "b", "c"}), TrackedState{}, term);
    emitter.emit(patch({{0, 1}, {2, 4}}), makeFrame({"A", "b", "C", "d"}), first.state, term);

    ASSERT_EQ(term.writes().size(), 2u);
    EXPECT_EQ(term.lastWrite().rfind(ansi::kSyncBegin, 0), 0u);
}
