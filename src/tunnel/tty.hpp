#ifndef _HC_TUNNEL_TTY_
#define _HC_TUNNEL_TTY_

#include "../pchheader.hpp"

/**
 * Operator terminal helpers.
 */
namespace tty
{
    constexpr uint16_t DEFAULT_ROWS = 24;
    constexpr uint16_t DEFAULT_COLS = 80;

    int check_terminal(const int in_fd);

    int enter_raw_mode(const int fd, struct termios &saved);

    int restore_mode(const int fd, const struct termios &saved);

    int restore_pending();

    void get_geometry(const int fd, uint16_t &rows, uint16_t &cols);

} // namespace tty

#endif
