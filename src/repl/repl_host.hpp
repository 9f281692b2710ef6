#ifndef _HC_REPL_REPL_HOST_
#define _HC_REPL_REPL_HOST_

#include "../pchheader.hpp"
#include "../console/prompt_coordinator.hpp"
#include "evaluator.hpp"
#include "history.hpp"
#include "line_editor.hpp"

namespace repl
{
    struct repl_options
    {
        std::string socket_path;   // Tunnel endpoint to connect to.
        std::string app_name;      // Shown in the prompt.
        std::string history_file;  // History persistence file.
        uint32_t connect_delay_ms; // Delay before each connect attempt.
    };

    /**
     * Runs the interactive loop of the worker over the tunnel socket. Reconnects whenever the
     * connection drops and persists history at the end of every session.
     */
    class repl_host
    {
    private:
        const repl_options options;
        const std::string prompt;
        console::prompt_coordinator &coordinator;
        line_editor &editor;
        evaluator &eval;
        history &hist;
        std::function<void()> shutdown_handler;

        std::atomic<bool> is_shutting_down = false;
        std::atomic<int> session_fd = -1;

        int connect_tunnel();
        int run_session();

    public:
        repl_host(const repl_options &options, console::prompt_coordinator &coordinator, line_editor &editor,
                  evaluator &eval, history &hist, std::function<void()> shutdown_handler);
        int run();
        void stop();
        int save_history();
    };

    const std::string make_prompt(const pid_t pid, std::string_view app_name);

} // namespace repl

#endif
