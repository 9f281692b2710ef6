#include <catch2/catch.hpp>
#include "test_helpers.hpp"
#include "tunnel/tty.hpp"
#include "tunnel/tunnel_server.hpp"
#include "util/util.hpp"
#include <sys/resource.h>

namespace
{
    // Pseudo terminal standing in for the operator terminal.
    struct pty_pair
    {
        int master = -1;
        int slave = -1;

        pty_pair()
        {
            master = posix_openpt(O_RDWR | O_NOCTTY | O_CLOEXEC);
            if (master == -1 || grantpt(master) == -1 || unlockpt(master) == -1)
                return;

            const char *name = ptsname(master);
            if (name)
                slave = open(name, O_RDWR | O_NOCTTY | O_CLOEXEC);
        }

        ~pty_pair()
        {
            if (slave != -1)
                close(slave);
            if (master != -1)
                close(master);
        }

        int set_size(const uint16_t rows, const uint16_t cols)
        {
            struct winsize ws;
            memset(&ws, 0, sizeof(ws));
            ws.ws_row = rows;
            ws.ws_col = cols;
            return ioctl(master, TIOCSWINSZ, &ws);
        }

        bool is_canonical()
        {
            struct termios t;
            return tcgetattr(slave, &t) == 0 && (t.c_lflag & ICANON);
        }
    };

    int connect_unix(const std::string &path)
    {
        const int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd == -1)
            return -1;

        struct sockaddr_un addr;
        memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        if (connect(fd, (struct sockaddr *)&addr, sizeof(addr)) == -1)
        {
            close(fd);
            return -1;
        }
        return fd;
    }

    bool wait_event(tunnel::tunnel_server &tunnel, const tunnel::TUNNEL_EVENT_TYPE type, tunnel::tunnel_event &event)
    {
        return testutil::wait_until([&]() {
            tunnel::tunnel_event ev;
            while (tunnel.try_dequeue_event(ev))
            {
                if (ev.type == type)
                {
                    event = ev;
                    return true;
                }
            }
            return false;
        },
                                    2000);
    }
} // namespace

TEST_CASE("Tunnel refuses a non interactive terminal", "[tunnel]")
{
    const std::string dir = testutil::make_temp_dir();
    int fds[2];
    REQUIRE(pipe(fds) == 0);

    REQUIRE(tty::check_terminal(fds[0]) == -1);

    tunnel::tunnel_server tunnel;
    REQUIRE(tunnel.init(dir + "/console.sock", fds[0], fds[1]) == -1);

    struct stat st;
    REQUIRE(stat((dir + "/console.sock").c_str(), &st) == -1);

    close(fds[0]);
    close(fds[1]);
    testutil::remove_dir_tree(dir);
}

TEST_CASE("Terminal geometry falls back to defaults", "[tunnel]")
{
    int fds[2];
    REQUIRE(pipe(fds) == 0);

    uint16_t rows = 0, cols = 0;
    tty::get_geometry(fds[0], rows, cols);
    REQUIRE(rows == tty::DEFAULT_ROWS);
    REQUIRE(cols == tty::DEFAULT_COLS);

    close(fds[0]);
    close(fds[1]);
}

TEST_CASE("Raw mode left behind by an interrupted holder is restored on exit", "[tunnel]")
{
    pty_pair pty;
    REQUIRE(pty.slave != -1);
    REQUIRE(pty.is_canonical());
    REQUIRE(tty::restore_pending() == 0);

    SECTION("Holder never restored")
    {
        struct termios saved;
        REQUIRE(tty::enter_raw_mode(pty.slave, saved) == 0);
        REQUIRE_FALSE(pty.is_canonical());

        REQUIRE(tty::restore_pending() == 0);
        REQUIRE(pty.is_canonical());
    }

    SECTION("Holder restored on its own")
    {
        struct termios saved;
        REQUIRE(tty::enter_raw_mode(pty.slave, saved) == 0);
        REQUIRE(tty::restore_mode(pty.slave, saved) == 0);
        REQUIRE(pty.is_canonical());

        // Later raw mode set by someone else is not undone by a stale record.
        struct termios other;
        REQUIRE(tcgetattr(pty.slave, &other) == 0);
        cfmakeraw(&other);
        REQUIRE(tcsetattr(pty.slave, TCSANOW, &other) == 0);
        REQUIRE(tty::restore_pending() == 0);
        REQUIRE_FALSE(pty.is_canonical());
    }
}

TEST_CASE("Tunnel relays between the terminal and one worker", "[tunnel]")
{
    pty_pair pty;
    REQUIRE(pty.slave != -1);
    REQUIRE(pty.set_size(33, 111) == 0);
    REQUIRE(pty.is_canonical());

    const std::string dir = testutil::make_temp_dir();
    const std::string sock_path = dir + "/console.sock";

    SECTION("Stale socket file is replaced")
    {
        const int stale = socket(AF_UNIX, SOCK_STREAM, 0);
        struct sockaddr_un addr;
        memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
        REQUIRE(bind(stale, (struct sockaddr *)&addr, sizeof(addr)) == 0);
        close(stale);

        tunnel::tunnel_server tunnel;
        REQUIRE(tunnel.init(sock_path, pty.slave, pty.slave) == 0);
        const int client = connect_unix(sock_path);
        REQUIRE(client != -1);
        close(client);
        tunnel.deinit();
    }

    SECTION("Non socket file at the path is an error")
    {
        REQUIRE(testutil::write_file(sock_path, "data") == 0);
        tunnel::tunnel_server tunnel;
        REQUIRE(tunnel.init(sock_path, pty.slave, pty.slave) == -1);
    }

    SECTION("Session lifecycle")
    {
        tunnel::tunnel_server tunnel;
        REQUIRE(tunnel.init(sock_path, pty.slave, pty.slave) == 0);
        REQUIRE(tunnel.is_idle());

        const int client = connect_unix(sock_path);
        REQUIRE(client != -1);

        tunnel::tunnel_event event;
        REQUIRE(wait_event(tunnel, tunnel::TUNNEL_EVENT_TYPE::CONNECTED, event));
        REQUIRE(event.rows == 33);
        REQUIRE(event.cols == 111);
        REQUIRE_FALSE(tunnel.is_idle());
        REQUIRE_FALSE(pty.is_canonical());

        // Keystrokes reach the worker byte by byte.
        REQUIRE(write(pty.master, "ab\x03", 3) == 3);
        REQUIRE(testutil::read_until(client, "ab\x03", 2000) == "ab\x03");

        // Worker output reaches the terminal with newline translation.
        REQUIRE(write(client, "out\n", 4) == 4);
        REQUIRE(testutil::read_until(pty.master, "out\r\n", 2000).find("out\r\n") != std::string::npos);

        // Resize is reported with the new geometry.
        REQUIRE(pty.set_size(40, 120) == 0);
        tunnel.notify_resize();
        REQUIRE(wait_event(tunnel, tunnel::TUNNEL_EVENT_TYPE::RESIZE, event));
        REQUIRE(event.rows == 40);
        REQUIRE(event.cols == 120);

        // Worker leaving restores the terminal.
        close(client);
        REQUIRE(wait_event(tunnel, tunnel::TUNNEL_EVENT_TYPE::DISCONNECTED, event));
        REQUIRE(testutil::wait_until([&]() { return tunnel.is_idle(); }, 2000));
        REQUIRE(pty.is_canonical());

        tunnel.deinit();
        struct stat st;
        REQUIRE(stat(sock_path.c_str(), &st) == -1);
    }

    SECTION("Operator terminal hangup is fatal")
    {
        tunnel::tunnel_server tunnel;
        REQUIRE(tunnel.init(sock_path, pty.slave, pty.slave) == 0);

        const int client = connect_unix(sock_path);
        REQUIRE(client != -1);
        tunnel::tunnel_event event;
        REQUIRE(wait_event(tunnel, tunnel::TUNNEL_EVENT_TYPE::CONNECTED, event));

        // Closing the master side is what an ssh drop looks like to the terminal.
        close(pty.master);
        pty.master = -1;
        REQUIRE(wait_event(tunnel, tunnel::TUNNEL_EVENT_TYPE::FATAL, event));

        // Relay has stopped instead of spinning on the dead terminal.
        struct rusage before, after;
        REQUIRE(getrusage(RUSAGE_SELF, &before) == 0);
        util::sleep(500);
        REQUIRE(getrusage(RUSAGE_SELF, &after) == 0);
        const auto cpu_ms = [](const struct rusage &ru) {
            return (ru.ru_utime.tv_sec + ru.ru_stime.tv_sec) * 1000 + (ru.ru_utime.tv_usec + ru.ru_stime.tv_usec) / 1000;
        };
        REQUIRE(cpu_ms(after) - cpu_ms(before) < 200);

        close(client);
        tunnel.deinit();
    }

    SECTION("Second worker waits until the first one leaves")
    {
        tunnel::tunnel_server tunnel;
        REQUIRE(tunnel.init(sock_path, pty.slave, pty.slave) == 0);

        const int first = connect_unix(sock_path);
        REQUIRE(first != -1);
        tunnel::tunnel_event event;
        REQUIRE(wait_event(tunnel, tunnel::TUNNEL_EVENT_TYPE::CONNECTED, event));

        const int second = connect_unix(sock_path);
        REQUIRE(second != -1);

        REQUIRE(write(pty.master, "1", 1) == 1);
        REQUIRE(testutil::read_until(first, "1", 2000) == "1");
        REQUIRE(testutil::read_for(second, 100).empty());

        close(first);
        REQUIRE(wait_event(tunnel, tunnel::TUNNEL_EVENT_TYPE::DISCONNECTED, event));
        REQUIRE(wait_event(tunnel, tunnel::TUNNEL_EVENT_TYPE::CONNECTED, event));

        REQUIRE(write(pty.master, "2", 1) == 1);
        REQUIRE(testutil::read_until(second, "2", 2000) == "2");

        close(second);
        tunnel.deinit();
        REQUIRE(pty.is_canonical());
    }

    testutil::remove_dir_tree(dir);
}
