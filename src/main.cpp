#include "component/Widgets.hpp"
#include "render/Renderer.hpp"
#include "terminal/BufferTerminal.hpp"
#include "terminal/ProcessTerminal.hpp"
#include "terminal/TerminalError.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <poll.h>
#include <unistd.h>

static std::atomic<bool> g_running{true};

static void signalHandler(int) {
    g_running = false;
}

static std::string getEnv(const char* name, const char* fallback = "") {
    if (const char* v = std::getenv(name)) return v;
    return fallback;
}

static std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

// KEY=value lines, optional `export ` prefix and quotes. Variables already
// set in the environment win over the file.
static void loadDotEnv(const char* path) {
    std::ifstream in(path);
    std::string raw;
    while (in && std::getline(in, raw)) {
        auto line = trim(raw);
        if (line.empty() || line.front() == '#') continue;
        if (line.compare(0, 7, "export ") == 0) line = trim(line.substr(7));

        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) continue;

        auto name  = trim(line.substr(0, eq));
        auto value = trim(line.substr(eq + 1));
        bool quoted = value.size() >= 2 &&
                      (value.front() == '"' || value.front() == '\'') &&
                      value.back() == value.front();
        if (quoted) value = value.substr(1, value.size() - 2);

        setenv(name.c_str(), value.c_str(), 0);
    }
}

static void setupLogging(bool headless) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        getEnv("DIFFTERM_LOG_FILE", "diffterm.log"), 1048576 * 5, 3));  // 5MB, 3 files

    // stdout is the rendering surface; only log to the console when headless
    if (headless)
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    auto logger = std::make_shared<spdlog::logger>("diffterm", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    std::string logLevel = getEnv("DIFFTERM_LOG_LEVEL", "info");
    if (logLevel == "debug")      spdlog::set_level(spdlog::level::debug);
    else if (logLevel == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (logLevel == "error") spdlog::set_level(spdlog::level::err);
    else                          spdlog::set_level(spdlog::level::info);
}

// Stable block, editor band between borders, then transient lines
static Lines scenarioFrame(int stable, const std::string& input, int trailing, int width) {
    Lines lines;
    for (int i = 0; i < stable; i++) lines.push_back("stable " + std::to_string(i));
    BorderedBox editor({input}, {&BorderStyle::flat(), "", 0, "…"});
    for (auto& l : editor.render(width)) lines.push_back(l);
    for (int i = 0; i < trailing; i++) lines.push_back("tail " + std::to_string(i));
    return lines;
}

// Replays grow -> shrink -> update against an in-memory terminal
static int runHeadless(const RendererConfig& config) {
    BufferTerminal terminal(32, 10);
    Renderer renderer(terminal, config);

    Lines current;
    renderer.addChild(Leaf("scenario", [&current](int) { return current; }));

    nlohmann::json report = nlohmann::json::array();
    auto step = [&](const std::string& name, Lines lines) {
        current = std::move(lines);
        renderer.render();
        auto j = renderer.stats().toJson();
        j["step"] = name;
        j["lines"] = current.size();
        report.push_back(j);
    };

    step("grow",   scenarioFrame(18, "input A", 9, terminal.columns()));
    step("shrink", scenarioFrame(18, "input A", 0, terminal.columns()));
    step("update", scenarioFrame(18, "input B", 0, terminal.columns()));
    step("idle",   scenarioFrame(18, "input B", 0, terminal.columns()));

    std::cout << report.dump(2) << std::endl;
    return 0;
}

static int runInteractive(const RendererConfig& config, int tickMs) {
    ProcessTerminal terminal;
    terminal.enableRawMode();

    Renderer renderer(terminal, config);

    auto header = std::make_shared<Text>(
        "diffterm — [g]row [s]hrink [o]verlay [q]uit, other keys type into the box",
        Text::Overflow::Truncate, 1, config.ellipsis);
    auto output = std::make_shared<Text>("", Text::Overflow::Wrap, 1);
    auto editor = std::make_shared<BorderedBox>(
        Lines{""}, BorderedBox::Options{&BorderStyle::rounded(), "input", 1, config.ellipsis});
    auto status = std::make_shared<Text>("", Text::Overflow::Truncate, 1, config.ellipsis);

    renderer.addChild(Leaf::of(header, "header"));
    renderer.addChild(Leaf::of(output, "output"));
    renderer.addChild(Leaf::of(editor, "editor"));
    renderer.addChild(Leaf::of(status, "status"));

    std::vector<std::string> outputLines;
    std::string input;
    int tick = 0;
    OverlayStack::Handle overlay = 0;

    auto syncOutput = [&] {
        std::string joined;
        for (size_t i = 0; i < outputLines.size(); i++) {
            if (i) joined += '\n';
            joined += outputLines[i];
        }
        output->setText(joined);
    };

    renderer.start();

    while (g_running) {
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        int ready = poll(&pfd, 1, tickMs);

        if (ready > 0 && (pfd.revents & POLLIN)) {
            char buf[64];
            ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
            for (ssize_t i = 0; i < n; i++) {
                char c = buf[i];
                if (c == 'q' || c == 3) {
                    g_running = false;
                } else if (c == 'g') {
                    for (int k = 0; k < 5; k++)
                        outputLines.push_back("line " + std::to_string(outputLines.size()));
                    syncOutput();
                } else if (c == 's') {
                    outputLines.resize(outputLines.size() > 5 ? outputLines.size() - 5 : 0);
                    syncOutput();
                } else if (c == 'o') {
                    if (overlay) {
                        renderer.hideOverlay(overlay);
                        overlay = 0;
                    } else {
                        auto help = std::make_shared<BorderedBox>(
                            Lines{"g  grow output", "s  shrink output",
                                  "o  close this overlay", "q  quit"},
                            BorderedBox::Options{&BorderStyle::sharp(), "help", 1, "…"});
                        overlay = renderer.showOverlay(Leaf::of(help, "help"),
                                                       OverlayOptions{30, 0});
                    }
                } else if (c == '\r' || c == '\n') {
                    if (!input.empty()) outputLines.push_back("> " + input);
                    input.clear();
                    syncOutput();
                } else if (c == 127 || c == 8) {
                    if (!input.empty()) input.pop_back();
                } else if (static_cast<unsigned char>(c) >= 0x20) {
                    input += c;
                }
            }
            editor->setContent({input});
            renderer.requestRender();
        }

        terminal.pollResize();

        tick++;
        auto& s = renderer.stats();
        status->setText("frames " + std::to_string(s.frames) +
                        "  full " + std::to_string(s.fullRedraws) +
                        "  patches " + std::to_string(s.incrementalPatches) +
                        "  bytes " + std::to_string(s.bytesWritten) +
                        "  last: " + s.lastReason +
                        "  tick " + std::to_string(tick));
        renderer.requestRender();
        renderer.flush();
    }

    renderer.stop();
    terminal.disableRawMode();
    spdlog::info("Render stats: {}", renderer.stats().toJson().dump());
    return 0;
}

int main(int argc, char* argv[]) {
    loadDotEnv(".env");

    std::string configPath = "config/diffterm.json";
    bool headlessFlag = false;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--headless") headlessFlag = true;
        else configPath = arg;
    }

    nlohmann::json raw = nlohmann::json::object();
    {
        std::ifstream f(configPath);
        if (f.is_open()) {
            try {
                f >> raw;
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "Invalid config " << configPath << ": " << e.what() << "\n";
                return 1;
            }
        }
    }

    bool headless = headlessFlag || raw.value("headless", false);
    int  tickMs   = raw.value("tick_ms", 250);
    setupLogging(headless);

    if (raw.empty())
        spdlog::info("No config at {} — using defaults", configPath);
    else
        spdlog::info("Loaded config: {}", configPath);

    RendererConfig config;
    try {
        config = RendererConfig::fromJson(raw);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Invalid renderer config: {}", e.what());
        return 1;
    }

    std::signal(SIGINT,  signalHandler);
    std::signal(SIGTERM, signalHandler);

    spdlog::info("diffterm v0.1.0 starting ({})", headless ? "headless" : "interactive");

    try {
        return headless ? runHeadless(config) : runInteractive(config, tickMs);
    } catch (const TerminalWriteError& e) {
        spdlog::error("Terminal lost: {}", e.what());
        return 1;
    }
}
