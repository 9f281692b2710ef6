#include <catch2/catch.hpp>
#include "test_helpers.hpp"
#include "util/debounce_timer.hpp"

TEST_CASE("Debounce timer coalesces schedules", "[debounce]")
{
    std::atomic<int> fired = 0;
    util::debounce_timer timer(60, [&]() { fired++; });

    SECTION("Burst results in one callback")
    {
        for (int i = 0; i < 5; i++)
        {
            timer.schedule();
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        REQUIRE(fired == 0);
        REQUIRE(timer.is_pending());

        REQUIRE(testutil::wait_until([&]() { return fired == 1; }, 2000));
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        REQUIRE(fired == 1);
        REQUIRE_FALSE(timer.is_pending());
    }

    SECTION("Cancelled timer never fires")
    {
        timer.schedule();
        timer.cancel();
        REQUIRE_FALSE(timer.is_pending());
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        REQUIRE(fired == 0);
    }

    SECTION("Separate quiet periods fire separately")
    {
        timer.schedule();
        REQUIRE(testutil::wait_until([&]() { return fired == 1; }, 2000));
        timer.schedule();
        REQUIRE(testutil::wait_until([&]() { return fired == 2; }, 2000));
    }
}

TEST_CASE("Debounce timer can be destroyed while armed", "[debounce]")
{
    std::atomic<int> fired = 0;
    {
        util::debounce_timer timer(5000, [&]() { fired++; });
        timer.schedule();
    }
    REQUIRE(fired == 0);
}
