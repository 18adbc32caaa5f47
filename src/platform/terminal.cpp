#include "terminal.hpp"
#include <iostream>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#  include <io.h>
#else
#  include <termios.h>
#  include <unistd.h>
#endif

namespace platform {

// ── Terminal queries ─────────────────────────────────────────

bool stdin_is_tty() {
#ifdef _WIN32
    return _isatty(_fileno(stdin)) != 0;
#else
    return isatty(STDIN_FILENO) != 0;
#endif
}

// ── EchoGuard ────────────────────────────────────────────────

#ifdef _WIN32

EchoGuard::EchoGuard() {
    if (!stdin_is_tty()) return;
    HANDLE h = GetStdHandle(STD_INPUT_HANDLE);
    if (!GetConsoleMode(h, &old_mode_)) return;
    SetConsoleMode(h, old_mode_ & ~ENABLE_ECHO_INPUT);
    active_ = true;
}

EchoGuard::~EchoGuard() {
    if (active_) SetConsoleMode(GetStdHandle(STD_INPUT_HANDLE), old_mode_);
}

#else // Unix

struct EchoGuard::Impl {
    struct termios old_term;
};

EchoGuard::EchoGuard() {
    if (!stdin_is_tty()) return;
    impl_ = new Impl;
    if (tcgetattr(STDIN_FILENO, &impl_->old_term) != 0) {
        delete impl_;
        impl_ = nullptr;
        return;
    }
    struct termios t = impl_->old_term;
    t.c_lflag &= ~ECHO;
    tcsetattr(STDIN_FILENO, TCSANOW, &t);
    active_ = true;
}

EchoGuard::~EchoGuard() {
    if (active_ && impl_) {
        tcsetattr(STDIN_FILENO, TCSANOW, &impl_->old_term);
    }
    delete impl_;
}

#endif

std::string read_hidden_line() {
    std::string line;
    {
        EchoGuard guard;
        std::getline(std::cin, line);
    }
    std::cout << "\n";
    return line;
}

} // namespace platform
