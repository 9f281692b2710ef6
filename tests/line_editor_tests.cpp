#include <catch2/catch.hpp>
#include "test_helpers.hpp"
#include "repl/history.hpp"
#include "repl/line_editor.hpp"

namespace
{
    // Editor attached to one end of a socket pair. The test plays the terminal on the other end.
    struct editor_fixture
    {
        repl::history hist{10};
        repl::line_editor editor{hist};
        int fds[2] = {-1, -1};

        editor_fixture()
        {
            if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == 0)
                editor.attach(fds[0]);
        }

        ~editor_fixture()
        {
            editor.detach();
            for (const int fd : fds)
            {
                if (fd != -1)
                    close(fd);
            }
        }

        void type(std::string_view keys)
        {
            if (write(fds[1], keys.data(), keys.size()) != (ssize_t)keys.size())
                FAIL("Could not write keys to the editor socket.");
        }

        std::string screen()
        {
            return testutil::read_for(fds[1], 50);
        }
    };
} // namespace

TEST_CASE("Line editor submits lines", "[line_editor]")
{
    editor_fixture f;
    REQUIRE(f.fds[0] != -1);
    std::string line;

    SECTION("Plain line")
    {
        f.type("hello\r");
        REQUIRE(f.editor.read_line("> ", line) == repl::LINE_SUBMITTED);
        REQUIRE(line == "hello");
        REQUIRE(f.screen() == "> hello\r\n");
    }

    SECTION("CRLF counts as one enter and lines are kept apart")
    {
        f.type("one\r\ntwo\n");
        REQUIRE(f.editor.read_line("> ", line) == repl::LINE_SUBMITTED);
        REQUIRE(line == "one");
        REQUIRE(f.editor.read_line("> ", line) == repl::LINE_SUBMITTED);
        REQUIRE(line == "two");
    }

    SECTION("Backspace removes the last character")
    {
        f.type("abc\x7f\r");
        REQUIRE(f.editor.read_line("> ", line) == repl::LINE_SUBMITTED);
        REQUIRE(line == "ab");
        REQUIRE(f.screen() == "> abc\b \b\r\n");
    }

    SECTION("Backspace removes a whole multi byte character")
    {
        f.type("h\xc3\xa9\x08\r");
        REQUIRE(f.editor.read_line("> ", line) == repl::LINE_SUBMITTED);
        REQUIRE(line == "h");
    }

    SECTION("Backspace on a wrapped line redraws from the first row")
    {
        f.editor.set_geometry(24, 5);
        f.type("abcdef\x7f\r");
        REQUIRE(f.editor.read_line("> ", line) == repl::LINE_SUBMITTED);
        REQUIRE(line == "abcde");
        REQUIRE(f.screen().find("\x1b[1A\r\x1b[J> abcde") != std::string::npos);
    }

    SECTION("Ctrl+U clears the line")
    {
        f.type("junk\x15ok\r");
        REQUIRE(f.editor.read_line("> ", line) == repl::LINE_SUBMITTED);
        REQUIRE(line == "ok");
    }

    SECTION("Ctrl+L clears the screen and keeps the input")
    {
        f.type("ab\x0c\r");
        REQUIRE(f.editor.read_line("> ", line) == repl::LINE_SUBMITTED);
        REQUIRE(line == "ab");
        REQUIRE(f.screen().find("\x1b[H\x1b[2J\r\x1b[J> ab") != std::string::npos);
    }

    SECTION("Other control keys are ignored")
    {
        f.type("a\x01\x02\x07" "b\r");
        REQUIRE(f.editor.read_line("> ", line) == repl::LINE_SUBMITTED);
        REQUIRE(line == "ab");
    }
}

TEST_CASE("Line editor exit keys", "[line_editor]")
{
    editor_fixture f;
    std::string line;

    SECTION("Ctrl+C clears a non empty line")
    {
        f.type("abc\x03xyz\r");
        REQUIRE(f.editor.read_line("> ", line) == repl::LINE_SUBMITTED);
        REQUIRE(line == "xyz");
        REQUIRE(f.screen().find("^C\r\n> xyz") != std::string::npos);
    }

    SECTION("Ctrl+C twice on an empty line exits")
    {
        f.type("\x03\x03");
        REQUIRE(f.editor.read_line("> ", line) == repl::OPERATOR_EXIT);
        REQUIRE(f.screen().find("(To exit, press Ctrl+C again or Ctrl+D or type .exit)") != std::string::npos);
    }

    SECTION("Typing between the two Ctrl+C presses disarms the exit")
    {
        f.type("\x03x\x7f\x03y\r");
        REQUIRE(f.editor.read_line("> ", line) == repl::LINE_SUBMITTED);
        REQUIRE(line == "y");
    }

    SECTION("Ctrl+D on an empty line exits")
    {
        f.type("\x04");
        REQUIRE(f.editor.read_line("> ", line) == repl::OPERATOR_EXIT);
    }

    SECTION("Ctrl+D with input is ignored")
    {
        f.type("a\x04" "b\r");
        REQUIRE(f.editor.read_line("> ", line) == repl::LINE_SUBMITTED);
        REQUIRE(line == "ab");
    }

    SECTION("Closed socket ends the session")
    {
        f.type("partial");
        REQUIRE(shutdown(f.fds[1], SHUT_WR) == 0);
        REQUIRE(f.editor.read_line("> ", line) == repl::SOCKET_END);
    }
}

TEST_CASE("Line editor browses history", "[line_editor]")
{
    editor_fixture f;
    f.hist.set_lines({"second", "first"});
    std::string line;

    SECTION("Up recalls the latest line")
    {
        f.type("\x1b[A\r");
        REQUIRE(f.editor.read_line("> ", line) == repl::LINE_SUBMITTED);
        REQUIRE(line == "second");
    }

    SECTION("Up twice recalls the older line and stops at the oldest")
    {
        f.type("\x1b[A\x1b[A\x1b[A\r");
        REQUIRE(f.editor.read_line("> ", line) == repl::LINE_SUBMITTED);
        REQUIRE(line == "first");
    }

    SECTION("Down returns to the unsubmitted input")
    {
        f.type("draft\x1b[A\x1b[B\r");
        REQUIRE(f.editor.read_line("> ", line) == repl::LINE_SUBMITTED);
        REQUIRE(line == "draft");
    }

    SECTION("Application mode arrow keys work too")
    {
        f.type("\x1bOA\r");
        REQUIRE(f.editor.read_line("> ", line) == repl::LINE_SUBMITTED);
        REQUIRE(line == "second");
    }
}

TEST_CASE("Line editor exposes the line being edited", "[line_editor]")
{
    editor_fixture f;
    std::string prompt, buffer;

    REQUIRE_FALSE(f.editor.current_line(prompt, buffer));

    std::string line;
    int res = 0;
    std::thread reader([&]() { res = f.editor.read_line("(1) hotcon/app >> ", line); });

    f.type("ab");
    const bool seen = testutil::wait_until([&]() {
        return f.editor.current_line(prompt, buffer) && buffer == "ab";
    },
                                           2000);

    f.type("\r");
    reader.join();

    REQUIRE(seen);
    REQUIRE(prompt == "(1) hotcon/app >> ");
    REQUIRE(res == repl::LINE_SUBMITTED);
    REQUIRE(line == "ab");
    REQUIRE_FALSE(f.editor.current_line(prompt, buffer));
}

TEST_CASE("Line editor output and geometry", "[line_editor]")
{
    repl::history hist(10);
    repl::line_editor editor(hist);

    REQUIRE(editor.write_output("x") == -1);

    REQUIRE(editor.get_cols() == 80);
    editor.set_geometry(30, 0);
    REQUIRE(editor.get_cols() == 80);
    editor.set_geometry(30, 132);
    REQUIRE(editor.get_cols() == 132);
}
