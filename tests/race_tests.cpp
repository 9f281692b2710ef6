#include <catch2/catch.hpp>
#include "util/race.hpp"

TEST_CASE("Race returns the first waiter to fire", "[race]")
{
    std::atomic<bool> loser_cancelled = false;

    const util::race_waiter slow = [&](const int cancel_fd) {
        const int res = util::wait_cancelled(cancel_fd, 5000);
        if (res == 1)
            loser_cancelled = true;
        return res == 0 ? 1 : 0;
    };

    const util::race_waiter fast = [](const int cancel_fd) {
        return util::wait_cancelled(cancel_fd, 20) == 0 ? 1 : 0;
    };

    SECTION("Fast waiter wins and the other is cancelled")
    {
        const auto start = std::chrono::steady_clock::now();
        REQUIRE(util::race({slow, fast}) == 1);
        REQUIRE(loser_cancelled);
        REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(2));
    }

    SECTION("Order of waiters does not matter")
    {
        REQUIRE(util::race({fast, slow}) == 0);
        REQUIRE(loser_cancelled);
    }

    SECTION("Race fails when every waiter fails")
    {
        const util::race_waiter failing = [](const int) { return -1; };
        REQUIRE(util::race({failing, failing}) == -1);
    }

    SECTION("Failing waiter does not stop the others")
    {
        const util::race_waiter failing = [](const int) { return -1; };
        REQUIRE(util::race({failing, fast}) == 1);
    }
}

TEST_CASE("Waiting for cancellation times out", "[race]")
{
    const int efd = eventfd(0, EFD_CLOEXEC);
    REQUIRE(efd != -1);

    REQUIRE(util::wait_cancelled(efd, 10) == 0);

    const uint64_t one = 1;
    REQUIRE(write(efd, &one, sizeof(one)) == sizeof(one));
    REQUIRE(util::wait_cancelled(efd, 1000) == 1);

    close(efd);
}
