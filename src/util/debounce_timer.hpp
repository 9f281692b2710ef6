#ifndef _HC_UTIL_DEBOUNCE_TIMER_
#define _HC_UTIL_DEBOUNCE_TIMER_

#include "../pchheader.hpp"

namespace util
{
    /**
     * Runs a callback once after a quiet period. Every schedule() call pushes the deadline
     * forward so a burst of schedule() calls results in a single callback invocation.
     */
    class debounce_timer
    {
    private:
        const uint32_t delay_ms;
        std::function<void()> callback;

        std::mutex timer_mutex;
        std::condition_variable timer_cv;
        std::optional<std::chrono::steady_clock::time_point> deadline;
        bool is_shutting_down = false;
        std::thread timer_thread;

        void timer_loop();

    public:
        debounce_timer(const uint32_t delay_ms, std::function<void()> callback);
        ~debounce_timer();
        void schedule();
        void cancel();
        bool is_pending();
    };

} // namespace util

#endif
