#pragma once

namespace platform {

// Get terminal dimensions of stdout.
int term_width();
int term_height();

// RAII guard for raw terminal mode.
// Constructor saves current mode and enters raw mode.
// Destructor restores the saved mode.
struct RawModeGuard {
    enum Mode {
        kFullRaw,   // cfmakeraw equivalent (for the shell attach relay)
        kNoEcho,    // Canonical off, echo off (for single-key prompts)
    };

    explicit RawModeGuard(Mode mode = kFullRaw);
    ~RawModeGuard();

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

// Poll stdin for input readability with a timeout.
// Returns true if stdin has data to read.
bool poll_stdin(int timeout_ms);

// SIGWINCH tracking. consume_terminal_resize() returns true once per
// window-size change observed since the last call.
void watch_terminal_resize();
void unwatch_terminal_resize();
bool consume_terminal_resize();

} // namespace platform
