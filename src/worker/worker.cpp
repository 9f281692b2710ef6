#include "../pchheader.hpp"
#include "../conf.hpp"
#include "../hclog.hpp"
#include "../util/util.hpp"
#include "../msg/controlmsg_common.hpp"
#include "../msg/controlmsg_parser.hpp"
#include "../watch/path_watcher.hpp"
#include "worker.hpp"

namespace worker
{
    constexpr int CONTROL_POLL_TIMEOUT = 50;

    worker_context ctx;

    /**
     * Sets up worker logging (through the prompt coordinator) and all worker subsystems.
     * @param control_fd Worker end of the control channel inherited from the supervisor.
     * @param debug_port Port for the inspector endpoint.
     * @return 0 on success. -1 on failure.
     */
    int init(const int control_fd, const uint16_t debug_port)
    {
        ctx.control_fd = control_fd;
        ctx.debug_port = debug_port;

        // Diagnostics reach the operator terminal through stderr, decorated by the coordinator.
        ctx.stderr_writer = std::make_unique<util::fd_writer>(STDERR_FILENO);
        ctx.coordinator = std::make_unique<console::prompt_coordinator>(*ctx.stderr_writer, conf::cfg.repl.redraw_debounce_ms);
        hclog::init("hcw", "hotcon-worker.log", *ctx.coordinator);

        ctx.hist = std::make_unique<repl::history>(conf::cfg.repl.history_size);
        ctx.editor = std::make_unique<repl::line_editor>(*ctx.hist);
        ctx.coordinator->set_source(ctx.editor.get());
        ctx.eval = std::make_unique<repl::command_evaluator>(*ctx.hist, debug_port, request_reload);

        repl::repl_options options;
        options.socket_path = conf::ctx.socket_path;
        options.app_name = conf::cfg.app.name;
        options.history_file = conf::ctx.history_file;
        options.connect_delay_ms = conf::cfg.repl.connect_delay_ms;
        ctx.host = std::make_unique<repl::repl_host>(options, *ctx.coordinator, *ctx.editor, *ctx.eval, *ctx.hist, request_shutdown);

        ctx.insp = std::make_unique<inspector>(*ctx.eval);
        if (ctx.insp->init(conf::ctx.debug_host, debug_port) == -1)
            return -1;

        ctx.watch_cancel_fd = eventfd(0, EFD_CLOEXEC);
        if (ctx.watch_cancel_fd == -1)
        {
            LOG_ERROR << errno << ": Error creating watcher cancellation eventfd.";
            return -1;
        }

        ctx.control_thread = std::thread(control_loop);
        ctx.watch_thread = std::thread(watch_loop);

        LOG_INFO << "Worker started. pid:" << getpid() << " debug port:" << debug_port;
        return 0;
    }

    /**
     * Runs the interactive console on the calling thread.
     * @return 0 after the operator exited the console. -1 on failure.
     */
    int run()
    {
        if (ctx.host->run() == -1)
            return -1;

        // Shutdown has been requested. The supervisor terminates this process.
        while (!ctx.is_shutting_down)
            util::sleep(100);

        return 0;
    }

    void deinit()
    {
        if (ctx.is_shutting_down.exchange(true))
            return;

        if (ctx.host)
            ctx.host->stop();

        if (ctx.watch_cancel_fd != -1)
        {
            const uint64_t one = 1;
            if (write(ctx.watch_cancel_fd, &one, sizeof(one)) == -1)
                LOG_ERROR << errno << ": Error cancelling file watcher.";
        }

        if (ctx.watch_thread.joinable())
            ctx.watch_thread.join();

        if (ctx.control_thread.joinable())
            ctx.control_thread.join();

        if (ctx.insp)
            ctx.insp->deinit();

        if (ctx.watch_cancel_fd != -1)
            close(ctx.watch_cancel_fd);

        if (ctx.control_fd != -1)
            close(ctx.control_fd);

        // Coordinator stays alive since the logger keeps writing into it until exit.
        if (ctx.coordinator)
            ctx.coordinator->set_closing(true);
    }

    /**
     * Asks the supervisor to replace this worker. Only the first request has an effect.
     */
    void request_reload()
    {
        if (ctx.reload_requested.exchange(true))
            return;

        if (conf::cfg.repl.save_history_on_reload && ctx.host && ctx.host->save_history() == -1)
            LOG_WARNING << "Console history was not saved before reload.";

        std::string msg;
        msg::controlmsg::create_reload_message(msg);
        ctx.outbound.enqueue(std::move(msg));
    }

    void request_shutdown()
    {
        std::string msg;
        msg::controlmsg::create_shutdown_message(msg);
        ctx.outbound.enqueue(std::move(msg));
    }

    int handle_control_message(std::string_view message)
    {
        msg::controlmsg::controlmsg_parser parser;
        std::string type;
        if (parser.parse(message) == -1 || parser.extract_type(type) == -1)
            return -1;

        if (type == msg::controlmsg::MSGTYPE_RESIZE)
        {
            uint16_t rows = 0, cols = 0;
            if (parser.extract_geometry(rows, cols) == -1)
                return -1;

            ctx.editor->set_geometry(rows, cols);
            LOG_DEBUG << "Terminal geometry " << cols << "x" << rows;
            return 0;
        }

        LOG_WARNING << "Unknown control message type: " << type;
        return -1;
    }

    /**
     * Sends queued messages to the supervisor and handles incoming control messages.
     */
    void control_loop()
    {
        util::mask_signal();

        char buf[msg::controlmsg::MAX_CONTROL_MSG_SIZE];
        std::string msg;

        while (!ctx.is_shutting_down)
        {
            while (ctx.outbound.try_dequeue(msg))
            {
                if (write(ctx.control_fd, msg.data(), msg.size()) == -1)
                    LOG_ERROR << errno << ": Error sending control message to supervisor.";
            }

            struct pollfd pfd = {ctx.control_fd, POLLIN, 0};
            const int res = poll(&pfd, 1, CONTROL_POLL_TIMEOUT);
            if (res == -1)
            {
                if (errno == EINTR)
                    continue;
                LOG_ERROR << errno << ": Control channel poll error.";
                break;
            }

            if (res == 0)
                continue;

            const ssize_t n = recv(ctx.control_fd, buf, sizeof(buf), 0);
            if (n <= 0)
            {
                // Nobody left to supervise us.
                LOG_WARNING << "Supervisor control channel closed. Exiting.";
                kill(getpid(), SIGTERM);
                break;
            }

            if (handle_control_message(std::string_view(buf, n)) == -1)
                LOG_DEBUG << "Control message ignored.";
        }
    }

    /**
     * Sends a reload request on the first change in the watched paths.
     */
    void watch_loop()
    {
        util::mask_signal();

        watch::path_watcher watcher;
        if (watcher.init(conf::ctx.watch_paths) == -1)
        {
            LOG_ERROR << "File watcher could not be started. Changes will not reload the worker.";
            return;
        }

        watch::watch_event event;
        if (watcher.wait_event(ctx.watch_cancel_fd, event) == 1)
        {
            LOG_INFO << "File " << event.path << " was " << (event.kind == watch::WATCH_EVENT_KIND::REMOVE ? "removed" : "updated") << ", reloading.";
            request_reload();
        }
    }

} // namespace worker
