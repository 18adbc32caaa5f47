#pragma once

#include <string>

namespace platform {

// True if stdin is attached to a terminal.
bool stdin_is_tty();

// RAII guard that turns off terminal echo for password entry.
// A no-op when stdin is not a terminal.
class EchoGuard {
public:
    EchoGuard();
    ~EchoGuard();

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

private:
    bool active_ = false;
#ifdef _WIN32
    unsigned long old_mode_ = 0;
#else
    struct Impl;
    Impl* impl_ = nullptr;
#endif
};

// Read one line from stdin without echoing it.
std::string read_hidden_line();

} // namespace platform
