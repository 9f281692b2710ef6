#include "../pchheader.hpp"
#include "../util/util.hpp"
#include "../tunnel/tty.hpp"
#include "line_editor.hpp"

namespace repl
{
    constexpr size_t READ_BUFFER_SIZE = 4096;
    constexpr const char *EXIT_HINT = "(To exit, press Ctrl+C again or Ctrl+D or type .exit)\r\n";
    constexpr const char *CLEAR_SCREEN = "\x1b[H\x1b[2J";

    // Control keys.
    constexpr char KEY_CTRL_C = 0x03;
    constexpr char KEY_CTRL_D = 0x04;
    constexpr char KEY_BS = 0x08;
    constexpr char KEY_LF = 0x0a;
    constexpr char KEY_CTRL_L = 0x0c;
    constexpr char KEY_CR = 0x0d;
    constexpr char KEY_CTRL_U = 0x15;
    constexpr char KEY_ESC = 0x1b;
    constexpr char KEY_DEL = 0x7f;

    line_editor::line_editor(history &hist) : hist(hist), cols(tty::DEFAULT_COLS)
    {
    }

    /**
     * Binds the editor to a newly connected socket. Any state of the previous connection is dropped.
     */
    void line_editor::attach(const int fd)
    {
        std::scoped_lock lock(editor_mutex);
        this->fd = fd;
        pending.clear();
        buffer.clear();
        esc_state = 0;
        last_was_cr = false;
        reading = false;
        write_failed = false;
    }

    void line_editor::detach()
    {
        std::scoped_lock lock(editor_mutex);
        fd = -1;
        reading = false;
    }

    void line_editor::set_geometry(const uint16_t rows, const uint16_t cols)
    {
        if (cols > 0)
            this->cols = cols;
    }

    uint16_t line_editor::get_cols() const
    {
        return cols;
    }

    bool line_editor::current_line(std::string &prompt, std::string &buffer) const
    {
        std::scoped_lock lock(editor_mutex);
        if (!reading)
            return false;

        prompt = this->prompt;
        buffer = this->buffer;
        return true;
    }

    // Socket write. Caller holds the editor lock, so no logging in here.
    void line_editor::emit(std::string_view data)
    {
        if (fd != -1 && util::write_to_fd(fd, data) == -1)
            write_failed = true;
    }

    int line_editor::write_output(std::string_view data)
    {
        std::scoped_lock lock(editor_mutex);
        if (fd == -1)
            return -1;
        return util::write_to_fd(fd, data);
    }

    /**
     * Redraws prompt and input from the first row of a possibly wrapped line.
     */
    void line_editor::refresh_line()
    {
        std::string out;
        const uint16_t width = cols;
        if (rendered_width > 0)
        {
            const size_t rows_up = (rendered_width - 1) / width;
            if (rows_up > 0)
                out.append("\x1b[").append(std::to_string(rows_up)).append("A");
        }
        out.append("\r\x1b[J").append(prompt).append(buffer);
        rendered_width = console::display_width(prompt) + console::display_width(buffer);
        emit(out);
    }

    void line_editor::show_history_entry(const int index)
    {
        const std::vector<std::string> lines = hist.get_lines();
        if (index >= (int)lines.size())
            return;

        if (history_index == -1)
            stash = buffer;

        history_index = index;
        buffer = (index == -1) ? stash : lines[index];
        refresh_line();
    }

    void line_editor::handle_escape_final(const char c)
    {
        if (c == 'A') // Up
            show_history_entry(history_index + 1);
        else if (c == 'B' && history_index >= 0) // Down
            show_history_entry(history_index - 1);
    }

    /**
     * Applies one input byte to the editor state.
     * @return LINE_SUBMITTED when 'line' was populated. OPERATOR_EXIT when the operator asked to exit.
     *         -1 to continue reading.
     */
    int line_editor::handle_byte(const char c, std::string &line)
    {
        if (esc_state == 1)
        {
            esc_state = (c == '[' || c == 'O') ? 2 : 0;
            return -1;
        }
        else if (esc_state == 2)
        {
            if (c >= 0x40 && c <= 0x7e)
            {
                esc_state = 0;
                handle_escape_final(c);
            }
            return -1;
        }

        const bool was_cr = last_was_cr;
        last_was_cr = (c == KEY_CR);

        if (c != KEY_CTRL_C)
            exit_armed = false;

        switch (c)
        {
        case KEY_ESC:
            esc_state = 1;
            return -1;

        case KEY_LF:
            if (was_cr)
                return -1; // CRLF counts as a single enter.
            [[fallthrough]];
        case KEY_CR:
            emit("\r\n");
            line = buffer;
            buffer.clear();
            rendered_width = 0;
            return LINE_SUBMITTED;

        case KEY_CTRL_C:
            if (!buffer.empty())
            {
                buffer.clear();
                history_index = -1;
                emit(std::string("^C\r\n").append(prompt));
                rendered_width = console::display_width(prompt);
                return -1;
            }
            if (exit_armed)
            {
                emit("^C\r\n");
                return OPERATOR_EXIT;
            }
            exit_armed = true;
            emit(std::string("^C\r\n").append(EXIT_HINT).append(prompt));
            rendered_width = console::display_width(prompt);
            return -1;

        case KEY_CTRL_D:
            if (buffer.empty())
            {
                emit("\r\n");
                return OPERATOR_EXIT;
            }
            return -1;

        case KEY_CTRL_U:
            buffer.clear();
            history_index = -1;
            refresh_line();
            return -1;

        case KEY_CTRL_L:
            emit(CLEAR_SCREEN);
            rendered_width = 0;
            refresh_line();
            return -1;

        case KEY_DEL:
        case KEY_BS:
        {
            if (buffer.empty())
                return -1;

            // Drop one whole UTF-8 code point.
            size_t pos = buffer.size() - 1;
            while (pos > 0 && (buffer[pos] & 0xC0) == 0x80)
                pos--;
            buffer.erase(pos);

            if (rendered_width <= cols)
            {
                emit("\b \b");
                rendered_width--;
            }
            else
            {
                refresh_line();
            }
            return -1;
        }

        default:
            if ((unsigned char)c < 0x20)
                return -1; // Other control keys are ignored.

            buffer.push_back(c);
            if ((c & 0xC0) != 0x80)
                rendered_width++;
            emit(std::string_view(&c, 1));
            return -1;
        }
    }

    /**
     * Shows the prompt and reads one line of input.
     * @param prompt Prompt to show.
     * @param line Submitted line.
     * @return LINE_SUBMITTED, OPERATOR_EXIT or SOCKET_END.
     */
    int line_editor::read_line(std::string_view prompt, std::string &line)
    {
        {
            std::scoped_lock lock(editor_mutex);
            this->prompt = prompt;
            buffer.clear();
            history_index = -1;
            exit_armed = false;
            rendered_width = console::display_width(prompt);
            reading = true;
            emit(prompt);
        }

        char buf[READ_BUFFER_SIZE];
        while (true)
        {
            {
                std::scoped_lock lock(editor_mutex);
                for (size_t i = 0; i < pending.size(); i++)
                {
                    const int res = handle_byte(pending[i], line);
                    if (res != -1)
                    {
                        pending.erase(0, i + 1);
                        reading = false;
                        return res;
                    }
                }
                pending.clear();

                if (write_failed)
                {
                    reading = false;
                    return SOCKET_END;
                }
            }

            const ssize_t n = read(fd, buf, sizeof(buf));
            if (n == -1 && errno == EINTR)
                continue;

            if (n <= 0)
            {
                if (n == -1 && errno != ECONNRESET)
                    LOG_DEBUG << errno << ": Console socket read error.";

                std::scoped_lock lock(editor_mutex);
                reading = false;
                return SOCKET_END;
            }

            std::scoped_lock lock(editor_mutex);
            pending.append(buf, n);
        }
    }

} // namespace repl
