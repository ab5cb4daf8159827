#pragma once

namespace platform {

// Get terminal dimensions.
int term_width();
int term_height();

// RAII guard for raw terminal mode (interactive relay).
// Constructor saves the current mode and enters raw mode.
// Destructor restores the saved mode. No-op when stdin is not a tty.
struct RawModeGuard {
    RawModeGuard();
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

// SIGWINCH tracking. take_resize() returns true once per resize.
void watch_terminal_resize();
void unwatch_terminal_resize();
bool take_resize();

} // namespace platform
