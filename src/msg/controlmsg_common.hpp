#ifndef _HC_MSG_CONTROLMSG_COMMON_
#define _HC_MSG_CONTROLMSG_COMMON_

#include "../pchheader.hpp"

namespace msg::controlmsg
{
    // Message field names
    constexpr const char *FLD_TYPE = "type";
    constexpr const char *FLD_ROWS = "rows";
    constexpr const char *FLD_COLS = "cols";

    // Message types (worker -> supervisor)
    constexpr const char *MSGTYPE_RELOAD = "reload";
    constexpr const char *MSGTYPE_SHUTDOWN = "shutdown";

    // Message types (supervisor -> worker)
    constexpr const char *MSGTYPE_RESIZE = "resize";

    // Max size of a single control message packet.
    constexpr size_t MAX_CONTROL_MSG_SIZE = 1024;

} // namespace msg::controlmsg

#endif
