#include "terminal.hpp"
#include <csignal>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <windows.h>
#  include <io.h>
#  include <cstdlib>
#else
#  include <termios.h>
#  include <unistd.h>
#  include <poll.h>
#endif

namespace platform {

bool stdin_is_tty() {
#ifdef _WIN32
    return _isatty(_fileno(stdin)) != 0;
#else
    return isatty(STDIN_FILENO) == 1;
#endif
}

// ── NoEchoGuard ──────────────────────────────────────────────

#ifdef _WIN32

NoEchoGuard::NoEchoGuard() {
    HANDLE h = GetStdHandle(STD_INPUT_HANDLE);
    GetConsoleMode(h, &old_mode_);
    DWORD new_mode = old_mode_;
    new_mode &= ~(ENABLE_LINE_INPUT | ENABLE_ECHO_INPUT | ENABLE_PROCESSED_INPUT);
    SetConsoleMode(h, new_mode);
}

NoEchoGuard::~NoEchoGuard() {
    SetConsoleMode(GetStdHandle(STD_INPUT_HANDLE), old_mode_);
}

#else // Unix

struct NoEchoGuard::Impl {
    struct termios old_term;
    bool saved = false;
};

NoEchoGuard::NoEchoGuard() : impl_(new Impl) {
    if (tcgetattr(STDIN_FILENO, &impl_->old_term) != 0) {
        return;  // not a terminal; nothing to restore
    }
    impl_->saved = true;
    struct termios raw = impl_->old_term;
    raw.c_lflag &= ~(ICANON | ECHO | ISIG);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);
}

NoEchoGuard::~NoEchoGuard() {
    if (impl_) {
        if (impl_->saved) {
            tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
        }
        delete impl_;
    }
}

#endif

// ── stdin ────────────────────────────────────────────────────

bool poll_stdin(int timeout_ms) {
#ifdef _WIN32
    HANDLE h = GetStdHandle(STD_INPUT_HANDLE);
    return WaitForSingleObject(h, timeout_ms) == WAIT_OBJECT_0;
#else
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & (POLLIN | POLLHUP));
#endif
}

bool read_stdin_byte(char& c) {
#ifdef _WIN32
    return _read(_fileno(stdin), &c, 1) == 1;
#else
    return read(STDIN_FILENO, &c, 1) == 1;
#endif
}

// ── SIGINT ───────────────────────────────────────────────────

static volatile std::sig_atomic_t g_interrupt_exit_code = 1;

static void interrupt_handler(int) {
#ifdef _WIN32
    std::_Exit(g_interrupt_exit_code);
#else
    _exit(g_interrupt_exit_code);
#endif
}

void exit_on_interrupt(int exit_code) {
    g_interrupt_exit_code = exit_code;
    std::signal(SIGINT, interrupt_handler);
}

} // namespace platform
