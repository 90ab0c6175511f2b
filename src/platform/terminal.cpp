#include "terminal.hpp"

#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include <poll.h>

namespace platform {

// ── Terminal dimensions ──────────────────────────────────────

int term_width() {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    return 80;
}

int term_height() {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0)
        return ws.ws_row;
    return 24;
}

bool stdin_is_tty() {
    return isatty(STDIN_FILENO) == 1;
}

// ── RawModeGuard ─────────────────────────────────────────────

struct RawModeGuard::Impl {
    struct termios old_term;
    bool saved = false;
};

RawModeGuard::RawModeGuard() : impl_(new Impl) {
    if (tcgetattr(STDIN_FILENO, &impl_->old_term) != 0) return;
    impl_->saved = true;
    struct termios raw = impl_->old_term;
    cfmakeraw(&raw);
    raw.c_oflag |= OPOST;   // keep "\n" -> "\r\n" for our own status lines
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);
}

RawModeGuard::~RawModeGuard() {
    if (impl_) {
        if (impl_->saved)
            tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
        delete impl_;
    }
}

// ── poll ─────────────────────────────────────────────────────

int poll_two(int fd_a, int fd_b, int timeout_ms) {
    struct pollfd pfds[2] = {
        {fd_a, POLLIN, 0},
        {fd_b, POLLIN, 0},
    };
    int n = poll(pfds, 2, timeout_ms);
    if (n <= 0) return 0;

    int mask = 0;
    if (pfds[0].revents & (POLLIN | POLLHUP)) mask |= 1;
    if (pfds[1].revents & (POLLIN | POLLHUP)) mask |= 2;
    return mask;
}

} // namespace platform
