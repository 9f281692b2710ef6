#include <catch2/catch.hpp>
#include "test_helpers.hpp"
#include "supervisor/restart_trigger.hpp"
#include "tunnel/tty.hpp"

TEST_CASE("Restart waits for a keypress or a file change", "[restart]")
{
    const std::string dir = testutil::make_temp_dir();
    REQUIRE_FALSE(dir.empty());

    int keys[2];
    REQUIRE(pipe2(keys, O_CLOEXEC) == 0);

    SECTION("Keypress")
    {
        std::atomic<bool> typed = false;
        std::thread typist([&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            typed = write(keys[1], "k", 1) == 1;
        });

        const int res = supervisor::wait_for_restart({dir}, keys[0], NULL);
        typist.join();
        REQUIRE(typed);
        REQUIRE(res == 0);
    }

    SECTION("File change")
    {
        std::thread editor([&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            testutil::write_file(dir + "/index.js", "x");
        });

        const int res = supervisor::wait_for_restart({dir}, keys[0], NULL);
        editor.join();
        REQUIRE(res == 0);

        // Keypress waiter was cancelled without consuming input.
        REQUIRE(testutil::read_for(keys[0], 20).empty());
    }

    SECTION("Closed terminal input leaves the file watcher in charge")
    {
        close(keys[1]);
        keys[1] = -1;

        std::thread editor([&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            testutil::write_file(dir + "/index.js", "x");
        });

        const int res = supervisor::wait_for_restart({dir}, keys[0], NULL);
        editor.join();
        REQUIRE(res == 0);
    }

    SECTION("Individual waiters honour cancellation")
    {
        const int efd = eventfd(0, EFD_CLOEXEC);
        REQUIRE(efd != -1);
        const uint64_t one = 1;
        REQUIRE(write(efd, &one, sizeof(one)) == sizeof(one));

        REQUIRE(supervisor::wait_for_keypress(keys[0], NULL, efd) == 0);
        REQUIRE(supervisor::wait_for_file_change({dir}, efd) == 0);
        close(efd);
    }

    close(keys[0]);
    if (keys[1] != -1)
        close(keys[1]);
    testutil::remove_dir_tree(dir);
}

TEST_CASE("Keypress wait on a terminal can be unwound from outside", "[restart]")
{
    const int master = posix_openpt(O_RDWR | O_NOCTTY | O_CLOEXEC);
    REQUIRE(master != -1);
    REQUIRE(grantpt(master) == 0);
    REQUIRE(unlockpt(master) == 0);
    const int slave = open(ptsname(master), O_RDWR | O_NOCTTY | O_CLOEXEC);
    REQUIRE(slave != -1);

    const auto is_canonical = [&]() {
        struct termios t;
        return tcgetattr(slave, &t) == 0 && (t.c_lflag & ICANON);
    };
    REQUIRE(is_canonical());

    const int efd = eventfd(0, EFD_CLOEXEC);
    REQUIRE(efd != -1);

    std::atomic<int> res = -2;
    std::thread waiter([&]() { res = supervisor::wait_for_keypress(slave, NULL, efd); });

    // Exit path restores the terminal while the waiter still holds raw mode.
    const bool went_raw = testutil::wait_until([&]() { return !is_canonical(); }, 2000);
    const int restored = tty::restore_pending();
    const bool canonical_after = is_canonical();

    const uint64_t one = 1;
    const bool cancelled = write(efd, &one, sizeof(one)) == sizeof(one);
    waiter.join();

    REQUIRE(went_raw);
    REQUIRE(restored == 0);
    REQUIRE(canonical_after);
    REQUIRE(cancelled);
    REQUIRE(res == 0);
    REQUIRE(is_canonical());

    close(efd);
    close(slave);
    close(master);
}
