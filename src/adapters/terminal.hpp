#pragma once

#include <csignal>
#include <string>
#include <string_view>
#include <expected>
#include <termios.h>
#include "../infra/error_handler/error.hpp"

namespace nxup::adapters::terminal {

/// Turns terminal echo off on `fd` and puts the saved mode back when destroyed.
/// While echo is off, SIGINT, SIGTERM, SIGHUP and SIGQUIT restore the saved
/// mode before the signal's default action runs, so an interrupted prompt does
/// not leave the terminal silent. Only one guard may be active at a time.
class EchoGuard {
public:
    explicit EchoGuard(int fd) : fd_(fd) {}
    ~EchoGuard();

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

    [[nodiscard]] bool disable_echo();

private:
    void restore();

    int fd_;
    termios saved_{};
    bool active_ = false;
    struct sigaction previous_[4]{};
};

/// Reads one line from the controlling terminal (/dev/tty) with echo disabled.
/// Piped stdin is never consulted.
[[nodiscard]] auto read_secret(std::string_view prompt) -> std::expected<std::string, infra::Error>;

} // namespace nxup::adapters::terminal
