#pragma once
#include <stdexcept>
#include <string>
#include <cstring>

// Raised by terminal ports when bytes cannot be delivered (EPIPE, EIO, ...).
// Not retried: a terminal that rejects writes cannot be recovered from
// inside the renderer.
class TerminalWriteError : public std::runtime_error {
public:
    explicit TerminalWriteError(int err)
        : std::runtime_error("terminal write failed: " +
                             std::string(std::strerror(err)))
        , errno_(err) {}

    TerminalWriteError(int err, const std::string& what)
        : std::runtime_error(what), errno_(err) {}

    int error() const { return errno_; }

private:
    int errno_;
};
