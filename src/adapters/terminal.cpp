#include "terminal.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iterator>
#include <unistd.h>
#include <fmt/core.h>

namespace nxup::adapters::terminal {

namespace {

constexpr int kRestoreSignals[] = {SIGINT, SIGTERM, SIGHUP, SIGQUIT};

// Состояние для обработчика сигналов: сам обработчик может звать только
// async-signal-safe функции, поэтому всё нужное лежит здесь заранее
int g_echo_fd = -1;
termios g_echo_saved{};

void restore_echo_and_reraise(int sig) {
    if (g_echo_fd != -1) {
        ::tcsetattr(g_echo_fd, TCSANOW, &g_echo_saved);
    }
    ::signal(sig, SIG_DFL);
    ::raise(sig);
}

// Закрывает дескриптор при выходе из области видимости
class FdCloser {
public:
    explicit FdCloser(int fd) : fd_(fd) {}
    ~FdCloser() { ::close(fd_); }

    FdCloser(const FdCloser&) = delete;
    FdCloser& operator=(const FdCloser&) = delete;

private:
    int fd_;
};

bool write_all(int fd, std::string_view text) {
    while (!text.empty()) {
        const auto n = ::write(fd, text.data(), text.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        text.remove_prefix(static_cast<std::size_t>(n));
    }
    return true;
}

} // namespace

EchoGuard::~EchoGuard() {
    restore();
}

bool EchoGuard::disable_echo() {
    if (active_) {
        return true;
    }
    if (::tcgetattr(fd_, &saved_) != 0) {
        return false;
    }

    g_echo_fd = fd_;
    g_echo_saved = saved_;
    struct sigaction action{};
    action.sa_handler = restore_echo_and_reraise;
    sigemptyset(&action.sa_mask);
    for (std::size_t i = 0; i < std::size(kRestoreSignals); ++i) {
        ::sigaction(kRestoreSignals[i], &action, &previous_[i]);
    }
    active_ = true;

    termios quiet = saved_;
    quiet.c_lflag &= ~ECHO;
    if (::tcsetattr(fd_, TCSANOW, &quiet) != 0) {
        restore();
        return false;
    }
    return true;
}

void EchoGuard::restore() {
    if (!active_) {
        return;
    }
    ::tcsetattr(fd_, TCSANOW, &saved_);
    for (std::size_t i = 0; i < std::size(kRestoreSignals); ++i) {
        ::sigaction(kRestoreSignals[i], &previous_[i], nullptr);
    }
    g_echo_fd = -1;
    active_ = false;
}

auto read_secret(std::string_view prompt) -> std::expected<std::string, infra::Error> {
    const int fd = ::open("/dev/tty", O_RDWR | O_CLOEXEC);
    if (fd == -1) {
        return std::unexpected(infra::make_error(infra::ErrorCode::TerminalUnavailable,
            fmt::format("Cannot open /dev/tty to prompt for a password: {}", std::strerror(errno))));
    }
    // Порядок важен: режим терминала восстанавливается до закрытия fd
    FdCloser closer{fd};
    EchoGuard echo{fd};

    if (!write_all(fd, prompt)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::TerminalUnavailable,
            "Cannot write the password prompt to the terminal"));
    }
    if (!echo.disable_echo()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::TerminalUnavailable,
            "Cannot disable terminal echo"));
    }

    std::string secret;
    char ch = 0;
    for (;;) {
        const auto n = ::read(fd, &ch, 1);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::make_error(infra::ErrorCode::TerminalUnavailable,
                fmt::format("Cannot read from the terminal: {}", std::strerror(errno))));
        }
        if (n == 0 || ch == '\n') break;
        if (ch != '\r') secret.push_back(ch);
    }

    // Эхо отключено, поэтому перевод строки выводим сами
    (void)write_all(fd, "\n");
    return secret;
}

} // namespace nxup::adapters::terminal
