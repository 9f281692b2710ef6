#ifndef _HC_WORKER_WORKER_
#define _HC_WORKER_WORKER_

#include "../pchheader.hpp"
#include "../util/writer.hpp"
#include "../console/prompt_coordinator.hpp"
#include "../repl/history.hpp"
#include "../repl/line_editor.hpp"
#include "../repl/evaluator.hpp"
#include "../repl/repl_host.hpp"
#include "inspector.hpp"

/**
 * Worker process runtime. Hosts the interactive console, the inspector endpoint and the
 * reload trigger, and talks to the supervisor over the control channel.
 */
namespace worker
{
    struct worker_context
    {
        int control_fd = -1;     // Worker end of the supervisor control channel.
        uint16_t debug_port = 0; // Port of the inspector endpoint.
        int watch_cancel_fd = -1;

        std::atomic<bool> is_shutting_down = false;
        std::atomic<bool> reload_requested = false;
        moodycamel::ConcurrentQueue<std::string> outbound; // Control messages to the supervisor.

        std::thread control_thread;
        std::thread watch_thread;

        std::unique_ptr<util::fd_writer> stderr_writer;
        std::unique_ptr<console::prompt_coordinator> coordinator;
        std::unique_ptr<repl::history> hist;
        std::unique_ptr<repl::line_editor> editor;
        std::unique_ptr<repl::command_evaluator> eval;
        std::unique_ptr<repl::repl_host> host;
        std::unique_ptr<inspector> insp;
    };

    extern worker_context ctx;

    int init(const int control_fd, const uint16_t debug_port);

    int run();

    void deinit();

    void request_reload();

    void request_shutdown();

    void control_loop();

    void watch_loop();

    int handle_control_message(std::string_view message);

} // namespace worker

#endif
