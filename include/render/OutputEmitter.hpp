#pragma once
#include "Frame.hpp"
#include "RedrawStrategist.hpp"
#include "TrackedState.hpp"
#include "terminal/ITerminal.hpp"
#include <cstddef>
#include <string>

// Turns a redraw decision into terminal bytes and computes the tracked
// state that holds once those bytes are written. A frame is always
// delivered with a single ITerminal::write call.
class OutputEmitter {
public:
    struct Options {
        bool synchronizedOutput = true;   // DEC mode 2026 around each frame
    };

    struct Emission {
        TrackedState state;   // state to commit after the write
        std::string  bytes;   // exactly what was (or will be) written
    };

    OutputEmitter();
    explicit OutputEmitter(Options options);

    // Build the byte stream without touching a terminal
    Emission compose(const RedrawDecision& decision,
                     const Frame& desired,
                     const TrackedState& tracked) const;

    // compose() + one write. Throws whatever the terminal throws; the
    // caller must then treat the tracked state as unknown.
    Emission emit(const RedrawDecision& decision,
                  const Frame& desired,
                  const TrackedState& tracked,
                  ITerminal& terminal) const;

private:
    Emission composeFull(const Frame& desired, const TrackedState& tracked) const;
    Emission composePatch(const RedrawDecision& decision,
                          const Frame& desired,
                          const TrackedState& tracked) const;

    static void appendLine(std::string& buf, const std::string& line);

    Options options_;
};
