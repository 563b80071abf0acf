#include <gtest/gtest.h>

#include <csignal>
#include <cstdlib>
#include <pty.h>
#include <unistd.h>

#include "adapters/terminal.hpp"

using nxup::adapters::terminal::EchoGuard;

namespace {

// Пара master/slave псевдотерминала, закрывается в деструкторе
struct Pty {
    int master = -1;
    int slave = -1;

    Pty() { (void)::openpty(&master, &slave, nullptr, nullptr, nullptr); }
    ~Pty() {
        if (slave != -1) ::close(slave);
        if (master != -1) ::close(master);
    }

    [[nodiscard]] bool echo_enabled() const {
        termios mode{};
        ::tcgetattr(slave, &mode);
        return (mode.c_lflag & ECHO) != 0;
    }
};

} // namespace

TEST(EchoGuardTest, RestoresEchoWhenDestroyed)
{
    Pty pty;
    ASSERT_NE(pty.slave, -1);
    ASSERT_TRUE(pty.echo_enabled());
    {
        EchoGuard guard{pty.slave};
        ASSERT_TRUE(guard.disable_echo());
        EXPECT_FALSE(pty.echo_enabled());
    }
    EXPECT_TRUE(pty.echo_enabled());
}

TEST(EchoGuardTest, RestoresPreviousSignalDisposition)
{
    Pty pty;
    ASSERT_NE(pty.slave, -1);
    {
        EchoGuard guard{pty.slave};
        ASSERT_TRUE(guard.disable_echo());
    }
    struct sigaction current{};
    ::sigaction(SIGINT, nullptr, &current);
    EXPECT_EQ(current.sa_handler, SIG_DFL);
}

TEST(EchoGuardTest, FailsOnNonTerminal)
{
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    {
        EchoGuard guard{fds[0]};
        EXPECT_FALSE(guard.disable_echo());
    }
    ::close(fds[0]);
    ::close(fds[1]);
}

TEST(EchoGuardDeathTest, InterruptRestoresEchoBeforeTerminating)
{
    Pty pty;
    ASSERT_NE(pty.slave, -1);
    ASSERT_TRUE(pty.echo_enabled());

    EXPECT_EXIT({
        EchoGuard guard{pty.slave};
        if (!guard.disable_echo()) std::_Exit(2);
        std::raise(SIGINT);
        std::_Exit(3);
    }, ::testing::KilledBySignal(SIGINT), "");

    EXPECT_TRUE(pty.echo_enabled());
}
