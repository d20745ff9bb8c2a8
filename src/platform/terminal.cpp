#include "terminal.hpp"

#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include <poll.h>
#include <signal.h>

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

// ── RawModeGuard ─────────────────────────────────────────────

struct RawModeGuard::Impl {
    struct termios old_term;
    bool saved = false;
};

RawModeGuard::RawModeGuard(Mode mode) : impl_(new Impl) {
    if (tcgetattr(STDIN_FILENO, &impl_->old_term) != 0) return;
    impl_->saved = true;
    struct termios raw = impl_->old_term;
    if (mode == kFullRaw) {
        cfmakeraw(&raw);
    } else {
        raw.c_lflag &= ~(ICANON | ECHO);
        raw.c_cc[VMIN] = 1;
        raw.c_cc[VTIME] = 0;
    }
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);
}

RawModeGuard::~RawModeGuard() {
    if (impl_->saved) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
    }
    delete impl_;
}

// ── poll_stdin ───────────────────────────────────────────────

bool poll_stdin(int timeout_ms) {
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & POLLIN);
}

// ── Resize tracking ──────────────────────────────────────────

static volatile sig_atomic_t g_resize_flag = 0;
static struct sigaction g_old_sa;

static void sigwinch_handler(int) {
    g_resize_flag = 1;
}

void watch_terminal_resize() {
    g_resize_flag = 0;

    struct sigaction sa;
    sa.sa_handler = sigwinch_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGWINCH, &sa, &g_old_sa);
}

void unwatch_terminal_resize() {
    sigaction(SIGWINCH, &g_old_sa, nullptr);
}

bool consume_terminal_resize() {
    if (!g_resize_flag) return false;
    g_resize_flag = 0;
    return true;
}

} // namespace platform
