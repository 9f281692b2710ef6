#include "../pchheader.hpp"
#include "util.hpp"
#include "race.hpp"

namespace util
{
    /**
     * Runs all the waiters concurrently and returns once the first of them fires.
     * The remaining waiters are cancelled through a shared eventfd and joined before returning,
     * so no waiter outlives the race.
     * @return Index of the winning waiter. -1 if none of them fired.
     */
    int race(const std::vector<race_waiter> &waiters)
    {
        if (waiters.empty())
            return -1;

        const int cancel_fd = eventfd(0, EFD_CLOEXEC);
        if (cancel_fd == -1)
        {
            LOG_ERROR << errno << ": Error creating race cancellation eventfd.";
            return -1;
        }

        std::mutex race_mutex;
        std::condition_variable race_cv;
        int winner = -1;
        size_t finished = 0;

        std::vector<std::thread> threads;
        threads.reserve(waiters.size());

        for (size_t i = 0; i < waiters.size(); i++)
        {
            threads.emplace_back([&, i]() {
                util::mask_signal();
                const int res = waiters[i](cancel_fd);

                std::scoped_lock lock(race_mutex);
                if (res == 1 && winner == -1)
                    winner = i;
                finished++;
                race_cv.notify_all();
            });
        }

        {
            std::unique_lock lock(race_mutex);
            race_cv.wait(lock, [&] { return winner != -1 || finished == waiters.size(); });
        }

        // Release the losers.
        const uint64_t one = 1;
        if (write(cancel_fd, &one, sizeof(one)) == -1)
            LOG_ERROR << errno << ": Error signalling race cancellation.";

        for (std::thread &t : threads)
            t.join();

        close(cancel_fd);
        return winner;
    }

    /**
     * Waits on the cancel fd for the given time.
     * @return 1 if cancelled. 0 on timeout. -1 on error.
     */
    int wait_cancelled(const int cancel_fd, const int timeout_ms)
    {
        struct pollfd pfd = {cancel_fd, POLLIN, 0};
        const int res = poll(&pfd, 1, timeout_ms);
        if (res == -1)
        {
            if (errno == EINTR)
                return 0;
            LOG_ERROR << errno << ": Error polling race cancellation fd.";
            return -1;
        }
        return res > 0 ? 1 : 0;
    }

} // namespace util
