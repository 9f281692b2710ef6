#include "../pchheader.hpp"
#include "debounce_timer.hpp"
#include "util.hpp"

namespace util
{
    debounce_timer::debounce_timer(const uint32_t delay_ms, std::function<void()> callback)
        : delay_ms(delay_ms), callback(std::move(callback))
    {
        timer_thread = std::thread(&debounce_timer::timer_loop, this);
    }

    debounce_timer::~debounce_timer()
    {
        {
            std::scoped_lock lock(timer_mutex);
            is_shutting_down = true;
        }
        timer_cv.notify_all();

        if (timer_thread.joinable())
            timer_thread.join();
    }

    /**
     * Arms the timer, or resets the deadline of an already armed timer.
     */
    void debounce_timer::schedule()
    {
        {
            std::scoped_lock lock(timer_mutex);
            deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(delay_ms);
        }
        timer_cv.notify_all();
    }

    void debounce_timer::cancel()
    {
        {
            std::scoped_lock lock(timer_mutex);
            deadline.reset();
        }
        timer_cv.notify_all();
    }

    bool debounce_timer::is_pending()
    {
        std::scoped_lock lock(timer_mutex);
        return deadline.has_value();
    }

    void debounce_timer::timer_loop()
    {
        util::mask_signal();

        std::unique_lock lock(timer_mutex);
        while (!is_shutting_down)
        {
            if (!deadline)
            {
                timer_cv.wait(lock);
                continue;
            }

            if (timer_cv.wait_until(lock, *deadline) == std::cv_status::timeout &&
                deadline && std::chrono::steady_clock::now() >= *deadline)
            {
                deadline.reset();

                // Callback runs without the lock so it can re-schedule the timer.
                lock.unlock();
                callback();
                lock.lock();
            }
        }
    }

} // namespace util
