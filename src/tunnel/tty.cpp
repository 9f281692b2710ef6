#include "../pchheader.hpp"
#include "tty.hpp"

namespace tty
{
    // Mode to put back on exit while some terminal is in raw mode.
    struct pending_restore
    {
        int fd = -1;
        struct termios mode;
    };
    std::optional<pending_restore> pending;
    std::mutex pending_mutex;

    /**
     * Checks whether the given fd is an interactive terminal which supports raw mode.
     * @return 0 if usable. -1 otherwise.
     */
    int check_terminal(const int in_fd)
    {
        struct termios t;
        if (!isatty(in_fd) || tcgetattr(in_fd, &t) == -1)
            return -1;
        return 0;
    }

    /**
     * Switches the terminal into raw mode and keeps the previous attributes in 'saved'.
     * Output post-processing is kept so newline translation still happens on the way out.
     */
    int enter_raw_mode(const int fd, struct termios &saved)
    {
        if (tcgetattr(fd, &saved) == -1)
        {
            LOG_ERROR << errno << ": Error reading terminal attributes.";
            return -1;
        }

        struct termios raw = saved;
        cfmakeraw(&raw);
        raw.c_oflag |= (OPOST | ONLCR);
        raw.c_cc[VMIN] = 1;
        raw.c_cc[VTIME] = 0;

        if (tcsetattr(fd, TCSANOW, &raw) == -1)
        {
            LOG_ERROR << errno << ": Error switching terminal to raw mode.";
            return -1;
        }

        std::scoped_lock lock(pending_mutex);
        if (!pending)
            pending = pending_restore{fd, saved};
        return 0;
    }

    int restore_mode(const int fd, const struct termios &saved)
    {
        {
            std::scoped_lock lock(pending_mutex);
            if (pending && pending->fd == fd)
                pending.reset();
        }

        if (tcsetattr(fd, TCSANOW, &saved) == -1)
        {
            LOG_ERROR << errno << ": Error restoring terminal mode.";
            return -1;
        }
        return 0;
    }

    /**
     * Puts back the mode recorded by the first enter_raw_mode() call that was not yet
     * restored. Used on exit paths which do not unwind the raw mode holder (eg. signals).
     * @return 0 when nothing was pending or the mode was restored. -1 on failure.
     */
    int restore_pending()
    {
        std::scoped_lock lock(pending_mutex);
        if (!pending)
            return 0;

        const pending_restore pr = *pending;
        pending.reset();
        if (tcsetattr(pr.fd, TCSANOW, &pr.mode) == -1)
        {
            LOG_ERROR << errno << ": Error restoring terminal mode.";
            return -1;
        }
        return 0;
    }

    // Falls back to 80x24 when the size cannot be queried.
    void get_geometry(const int fd, uint16_t &rows, uint16_t &cols)
    {
        struct winsize ws;
        if (ioctl(fd, TIOCGWINSZ, &ws) == -1 || ws.ws_row == 0 || ws.ws_col == 0)
        {
            rows = DEFAULT_ROWS;
            cols = DEFAULT_COLS;
            return;
        }
        rows = ws.ws_row;
        cols = ws.ws_col;
    }

} // namespace tty
