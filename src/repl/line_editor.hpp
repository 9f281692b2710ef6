#ifndef _HC_REPL_LINE_EDITOR_
#define _HC_REPL_LINE_EDITOR_

#include "../pchheader.hpp"
#include "../console/prompt_coordinator.hpp"
#include "history.hpp"

namespace repl
{
    // read_line() results.
    constexpr int LINE_SUBMITTED = 1;
    constexpr int OPERATOR_EXIT = 0;
    constexpr int SOCKET_END = -1;

    /**
     * Minimal line editor working over a socket connected to the operator terminal
     * (through the tunnel) instead of a local terminal device.
     */
    class line_editor : public console::line_source
    {
    private:
        history &hist;
        int fd = -1;

        mutable std::mutex editor_mutex;
        std::string prompt;
        std::string buffer;
        bool reading = false;
        bool write_failed = false;
        size_t rendered_width = 0; // Width of prompt + buffer as last rendered.
        std::atomic<uint16_t> cols;

        std::string pending; // Received bytes not processed yet.
        int esc_state = 0;   // 0: none, 1: got ESC, 2: inside a CSI/SS3 sequence.
        bool last_was_cr = false;
        bool exit_armed = false; // Ctrl+C pressed once on an empty line.
        int history_index = -1;
        std::string stash; // Unsubmitted line kept while browsing history.

        int handle_byte(const char c, std::string &line);
        void handle_escape_final(const char c);
        void show_history_entry(const int index);
        void refresh_line();
        void emit(std::string_view data);

    public:
        explicit line_editor(history &hist);
        void attach(const int fd);
        void detach();
        int read_line(std::string_view prompt, std::string &line);
        int write_output(std::string_view data);
        void set_geometry(const uint16_t rows, const uint16_t cols);
        uint16_t get_cols() const;
        bool current_line(std::string &prompt, std::string &buffer) const override;
    };

} // namespace repl

#endif
