#ifndef _HC_UTIL_RACE_
#define _HC_UTIL_RACE_

#include "../pchheader.hpp"

namespace util
{
    /**
     * A waiter blocks until its event happens or the cancel fd becomes readable.
     * Returns 1 when its event fired, 0 when cancelled and -1 on error.
     */
    typedef std::function<int(const int cancel_fd)> race_waiter;

    int race(const std::vector<race_waiter> &waiters);

    int wait_cancelled(const int cancel_fd, const int timeout_ms);

} // namespace util

#endif
