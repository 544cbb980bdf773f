#include "terminal/ProcessTerminal.hpp"
#include "terminal/Ansi.hpp"
#include "terminal/TerminalError.hpp"
#include <ftxui/screen/terminal.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <csignal>
#include <unistd.h>

namespace {

std::atomic<bool> g_resizePending{false};

void onSigwinch(int) {
    g_resizePending.store(true, std::memory_order_relaxed);
}

}  // namespace

ProcessTerminal::ProcessTerminal(int outFd, int inFd)
    : outFd_(outFd), inFd_(inFd)
{
    refreshSize();

    struct sigaction sa{};
    sa.sa_handler = onSigwinch;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (sigaction(SIGWINCH, &sa, nullptr) != 0)
        spdlog::warn("Cannot install SIGWINCH handler: resize tracking disabled");

    // A closed reader must surface as EPIPE from write(), not kill the process
    struct sigaction ignore{};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    if (sigaction(SIGPIPE, &ignore, nullptr) != 0)
        spdlog::warn("Cannot ignore SIGPIPE: {}", std::strerror(errno));
}

ProcessTerminal::~ProcessTerminal() {
    disableRawMode();
}

void ProcessTerminal::write(const std::string& bytes) {
    const char* p = bytes.data();
    size_t left = bytes.size();

    while (left > 0) {
        ssize_t n = ::write(outFd_, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TerminalWriteError(errno);
        }
        p    += n;
        left -= static_cast<size_t>(n);
    }
}

void ProcessTerminal::moveCursorBy(int deltaLines) {
    write(ansi::cursorMove(deltaLines));
}

void ProcessTerminal::clearLine() {
    write(std::string("\r") + ansi::kClearLine);
}

void ProcessTerminal::clearFromCursor() {
    write(ansi::kClearFromCursor);
}

void ProcessTerminal::clearScreen() {
    write(ansi::fullClear());
}

void ProcessTerminal::hideCursor() {
    write(ansi::kHideCursor);
}

void ProcessTerminal::showCursor() {
    write(ansi::kShowCursor);
}

void ProcessTerminal::enterAlternateScreen() {
    write(ansi::kAltScreenEnter);
}

void ProcessTerminal::leaveAlternateScreen() {
    write(ansi::kAltScreenLeave);
}

void ProcessTerminal::setTitle(const std::string& title) {
    write(ansi::setTitle(title));
}

bool ProcessTerminal::enableRawMode() {
    if (rawMode_) return true;
    if (!isatty(inFd_)) {
        spdlog::debug("stdin is not a TTY — raw mode skipped");
        return false;
    }
    if (tcgetattr(inFd_, &savedTermios_) != 0) {
        spdlog::warn("tcgetattr failed: {}", std::strerror(errno));
        return false;
    }

    ::termios raw = savedTermios_;
    raw.c_lflag &= ~(ECHO | ICANON | IEXTEN);
    raw.c_iflag &= ~(IXON | ICRNL);
    raw.c_cc[VMIN]  = 0;
    raw.c_cc[VTIME] = 0;

    if (tcsetattr(inFd_, TCSAFLUSH, &raw) != 0) {
        spdlog::warn("tcsetattr failed: {}", std::strerror(errno));
        return false;
    }
    rawMode_ = true;
    return true;
}

void ProcessTerminal::disableRawMode() {
    if (!rawMode_) return;
    if (tcsetattr(inFd_, TCSAFLUSH, &savedTermios_) != 0)
        spdlog::warn("Failed to restore terminal mode: {}", std::strerror(errno));
    rawMode_ = false;
}

bool ProcessTerminal::pollResize() {
    if (!g_resizePending.exchange(false, std::memory_order_relaxed))
        return false;

    refreshSize();
    spdlog::debug("Terminal resized to {}x{}", columns_, rows_);
    if (onResize) onResize();
    return true;
}

void ProcessTerminal::refreshSize() {
    auto size = ftxui::Terminal::Size();
    columns_ = size.dimx > 0 ? size.dimx : 80;
    rows_    = size.dimy > 0 ? size.dimy : 24;
}
