#include "terminal.hpp"
#include <iostream>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

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

bool stdout_is_tty() {
    return isatty(STDOUT_FILENO) != 0;
}

// ── NoEchoGuard ──────────────────────────────────────────────

struct NoEchoGuard::Impl {
    struct termios old_term;
    bool active = false;
};

NoEchoGuard::NoEchoGuard() : impl_(new Impl) {
    if (!isatty(STDIN_FILENO)) return;
    if (tcgetattr(STDIN_FILENO, &impl_->old_term) != 0) return;
    struct termios quiet = impl_->old_term;
    quiet.c_lflag &= ~ECHO;
    quiet.c_lflag |= ECHONL;
    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &quiet) == 0) {
        impl_->active = true;
    }
}

NoEchoGuard::~NoEchoGuard() {
    if (impl_->active) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
    }
    delete impl_;
}

// ── read_password ────────────────────────────────────────────

std::string read_password(const std::string& prompt) {
    std::cerr << prompt << std::flush;

    std::string line;
    {
        NoEchoGuard guard;
        if (!std::getline(std::cin, line)) {
            line.clear();
        }
    }
    if (!isatty(STDIN_FILENO)) std::cerr << "\n";
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

} // namespace platform
