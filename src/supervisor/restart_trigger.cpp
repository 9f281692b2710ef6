#include "../pchheader.hpp"
#include "../util/race.hpp"
#include "../tunnel/tty.hpp"
#include "../watch/path_watcher.hpp"
#include "restart_trigger.hpp"

namespace supervisor
{
    constexpr int IDLE_CHECK_INTERVAL = 50;

    /**
     * Waits for a change in any of the watched paths.
     * @return 1 when a change was observed. 0 if cancelled. -1 on error.
     */
    int wait_for_file_change(const std::vector<std::string> &paths, const int cancel_fd)
    {
        watch::path_watcher watcher;
        if (watcher.init(paths) == -1)
            return -1;

        watch::watch_event event;
        const int res = watcher.wait_event(cancel_fd, event);
        if (res == 1)
            LOG_INFO << "File " << event.path << " was " << (event.kind == watch::WATCH_EVENT_KIND::REMOVE ? "removed" : "updated") << ". Restarting worker.";

        return res;
    }

    /**
     * Waits for any single keypress on the supervisor terminal. The terminal is only read once
     * the tunnel has no session, so keystrokes meant for the worker are never consumed here.
     * @return 1 when a key was pressed. 0 if cancelled. -1 on error.
     */
    int wait_for_keypress(const int in_fd, const tunnel::tunnel_server *tunnel, const int cancel_fd)
    {
        while (tunnel && !tunnel->is_idle())
        {
            const int res = util::wait_cancelled(cancel_fd, IDLE_CHECK_INTERVAL);
            if (res != 0)
                return res == 1 ? 0 : -1;
        }

        struct termios saved;
        const bool is_raw = (tty::check_terminal(in_fd) == 0 && tty::enter_raw_mode(in_fd, saved) == 0);

        int ret = 0;
        while (true)
        {
            struct pollfd pfds[2] = {{in_fd, POLLIN, 0}, {cancel_fd, POLLIN, 0}};
            if (poll(pfds, 2, -1) == -1)
            {
                if (errno == EINTR)
                    continue;
                LOG_ERROR << errno << ": Keypress wait poll error.";
                ret = -1;
                break;
            }

            if (pfds[1].revents & POLLIN)
                break;

            if (pfds[0].revents & (POLLHUP | POLLERR))
            {
                // Terminal gone. Leave the restart to the file watcher.
                LOG_WARNING << "Terminal input closed. Only file changes will restart the worker.";
                const int res = util::wait_cancelled(cancel_fd, -1);
                ret = (res == -1) ? -1 : 0;
                break;
            }

            if (pfds[0].revents & POLLIN)
            {
                char c;
                if (read(in_fd, &c, 1) == 1)
                {
                    LOG_INFO << "Key pressed. Restarting worker.";
                    ret = 1;
                    break;
                }
            }
        }

        if (is_raw && tty::restore_mode(in_fd, saved) == -1)
            LOG_WARNING << "Terminal mode could not be restored after keypress wait.";

        return ret;
    }

    /**
     * Blocks until the first of a watched file change or a keypress. The other waiter is cancelled.
     * @return 0 when a restart should happen. -1 on error.
     */
    int wait_for_restart(const std::vector<std::string> &paths, const int in_fd, const tunnel::tunnel_server *tunnel)
    {
        const std::vector<util::race_waiter> waiters = {
            [&](const int cancel_fd) { return wait_for_file_change(paths, cancel_fd); },
            [&](const int cancel_fd) { return wait_for_keypress(in_fd, tunnel, cancel_fd); }};

        return util::race(waiters) == -1 ? -1 : 0;
    }

} // namespace supervisor
