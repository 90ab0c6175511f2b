#pragma once

namespace platform {

// Get terminal dimensions (80x24 when stdout is not a terminal).
int term_width();
int term_height();

// True if stdin is an interactive terminal.
bool stdin_is_tty();

// RAII guard for raw terminal mode.
// Constructor saves current mode and enters raw mode.
// Destructor restores the saved mode.
struct RawModeGuard {
    RawModeGuard();
    ~RawModeGuard();

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

// Wait until fd_a or fd_b is readable, or timeout_ms elapses.
// Returns a bitmask: 1 if fd_a is readable, 2 if fd_b is readable.
int poll_two(int fd_a, int fd_b, int timeout_ms);

} // namespace platform
