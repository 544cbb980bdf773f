#pragma once
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>

// Renderer tuning and terminal-mode options, loadable from JSON
struct RendererConfig {
    double      fullRedrawThreshold = 1.0;   // >= 1 disables the heuristic
    bool        synchronizedOutput  = true;
    bool        alternateScreen     = false;
    bool        hideCursor          = true;
    std::string title;
    std::string ellipsis            = "…";

    nlohmann::json toJson() const {
        return {
            {"full_redraw_threshold", fullRedrawThreshold},
            {"synchronized_output",   synchronizedOutput},
            {"alternate_screen",      alternateScreen},
            {"hide_cursor",           hideCursor},
            {"title",                 title},
            {"ellipsis",              ellipsis}
        };
    }

    // Missing keys keep their defaults, unknown keys are ignored.
    // Throws nlohmann::json::type_error on wrongly typed values.
    static RendererConfig fromJson(const nlohmann::json& j) {
        RendererConfig c;
        if (!j.is_object()) return c;

        c.fullRedrawThreshold = std::clamp(
            j.value("full_redraw_threshold", c.fullRedrawThreshold), 0.0, 1.0);
        c.synchronizedOutput  = j.value("synchronized_output", c.synchronizedOutput);
        c.alternateScreen     = j.value("alternate_screen", c.alternateScreen);
        c.hideCursor          = j.value("hide_cursor", c.hideCursor);
        c.title               = j.value("title", c.title);
        c.ellipsis            = j.value("ellipsis", c.ellipsis);
        return c;
    }

    // Throws std::runtime_error if the file cannot be opened and
    // nlohmann::json::parse_error if it is not valid JSON.
    static RendererConfig load(const std::string& path) {
        std::ifstream f(path);
        if (!f.is_open())
            throw std::runtime_error("Cannot open config file: " + path);
        return fromJson(nlohmann::json::parse(f));
    }
};
