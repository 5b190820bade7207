#pragma once

namespace platform {

// True when stdin is attached to a terminal (prompts can turn echo off).
bool stdin_is_tty();

// RAII guard that turns terminal echo off for secret entry.
// Constructor saves current mode; destructor restores it.
// Canonical mode and signal keys are disabled too, so Ctrl-C and Ctrl-D
// arrive as bytes (0x03, 0x04) and the reader decides what they mean.
struct NoEchoGuard {
    NoEchoGuard();
    ~NoEchoGuard();

    NoEchoGuard(const NoEchoGuard&) = delete;
    NoEchoGuard& operator=(const NoEchoGuard&) = delete;

private:
#ifdef _WIN32
    unsigned long old_mode_ = 0;
#else
    struct Impl;
    Impl* impl_ = nullptr;
#endif
};

// Poll stdin for input readability with a timeout.
// Returns true if stdin has data to read.
bool poll_stdin(int timeout_ms);

// Read one byte from stdin. Returns false on EOF or error.
bool read_stdin_byte(char& c);

// Exit immediately with `exit_code` on SIGINT. Nothing is flushed; callers
// rely on saves being atomic renames, so an interrupted prompt leaves the
// database exactly as it was.
void exit_on_interrupt(int exit_code);

} // namespace platform
