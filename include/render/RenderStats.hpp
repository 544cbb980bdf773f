#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

// Counters exposed for diagnostics and tests
struct RenderStats {
    std::uint64_t frames             = 0;
    std::uint64_t fullRedraws        = 0;
    std::uint64_t incrementalPatches = 0;   // includes no-op frames
    std::uint64_t noopFrames         = 0;
    std::uint64_t bytesWritten       = 0;
    std::uint64_t componentErrors    = 0;
    std::string   lastDecision;
    std::string   lastReason;

    nlohmann::json toJson() const {
        return {
            {"frames",              frames},
            {"full_redraws",        fullRedraws},
            {"incremental_patches", incrementalPatches},
            {"noop_frames",         noopFrames},
            {"bytes_written",       bytesWritten},
            {"component_errors",    componentErrors},
            {"last_decision",       lastDecision},
            {"last_reason",         lastReason}
        };
    }
};
