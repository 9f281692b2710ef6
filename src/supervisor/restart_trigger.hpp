#ifndef _HC_SUPERVISOR_RESTART_TRIGGER_
#define _HC_SUPERVISOR_RESTART_TRIGGER_

#include "../pchheader.hpp"
#include "../tunnel/tunnel_server.hpp"

namespace supervisor
{
    int wait_for_file_change(const std::vector<std::string> &paths, const int cancel_fd);

    int wait_for_keypress(const int in_fd, const tunnel::tunnel_server *tunnel, const int cancel_fd);

    int wait_for_restart(const std::vector<std::string> &paths, const int in_fd, const tunnel::tunnel_server *tunnel);

} // namespace supervisor

#endif
