#include "../pchheader.hpp"
#include "../msg/controlmsg_common.hpp"
#include "../msg/controlmsg_parser.hpp"
#include "../util/util.hpp"
#include "supervisor.hpp"

namespace supervisor
{
    constexpr int CONTROL_POLL_TIMEOUT = 100;

    worker_supervisor::worker_supervisor(process_launcher &launcher, const uint16_t base_debug_port)
        : launcher(launcher), next_debug_port(base_debug_port)
    {
    }

    const std::atomic<uint16_t> &worker_supervisor::debug_port() const
    {
        return current_debug_port;
    }

    void worker_supervisor::attach_proxy(proxy::debug_proxy *debug_proxy)
    {
        this->debug_proxy = debug_proxy;
    }

    void worker_supervisor::set_restart_trigger(restart_trigger trigger)
    {
        this->trigger = std::move(trigger);
    }

    void worker_supervisor::add_listener(state_listener listener)
    {
        listeners.push_back(std::move(listener));
    }

    SUPERVISOR_STATE worker_supervisor::get_state() const
    {
        return state;
    }

    const std::optional<worker_process> &worker_supervisor::get_worker() const
    {
        return worker;
    }

    void worker_supervisor::notify(std::string_view message)
    {
        for (const state_listener &listener : listeners)
            listener(message);
    }

    int worker_supervisor::start()
    {
        if (state != SUPERVISOR_STATE::NO_WORKER)
        {
            LOG_ERROR << "Supervisor already started.";
            return -1;
        }
        return spawn_worker();
    }

    /**
     * Spawns a new worker with the next debug port in sequence.
     */
    int worker_supervisor::spawn_worker()
    {
        state = SUPERVISOR_STATE::STARTING;

        worker_process w;
        w.debug_port = next_debug_port++;
        if (launcher.spawn(w) == -1)
        {
            LOG_ERROR << "Failed to start worker.";
            return -1;
        }

        w.state = WORKER_STATE::RUNNING;
        worker = w;
        control_closed = false;
        current_debug_port = w.debug_port;
        state = SUPERVISOR_STATE::RUNNING;

        LOG_INFO << "Worker started. pid:" << w.pid << " debug port:" << w.debug_port;
        notify("worker online");

        // A fresh worker needs the terminal geometry of the tunnel.
        if (rows > 0 && cols > 0 && set_geometry(rows, cols) == -1)
            LOG_WARNING << "Could not send terminal geometry to the worker.";
        return 0;
    }

    /**
     * Terminates the current worker as a managed exit.
     */
    int worker_supervisor::stop_worker()
    {
        if (!worker)
            return 0;

        worker->managed_exit = true;
        const int res = launcher.terminate(*worker);
        if (res == -1)
            LOG_ERROR << "Error terminating worker pid " << worker->pid;

        worker.reset();
        return res;
    }

    /**
     * Reacts to a control message sent by the worker.
     * @return 0 on success. -1 on failure.
     */
    int worker_supervisor::handle_control_message(std::string_view type)
    {
        if (type == msg::controlmsg::MSGTYPE_RELOAD)
        {
            if (state != SUPERVISOR_STATE::RUNNING)
            {
                LOG_DEBUG << "Reload ignored. No running worker.";
                return 0;
            }

            LOG_INFO << "Reloading worker.";
            state = SUPERVISOR_STATE::RELOADING;

            // Proxy must stop handing out connections to the dying worker.
            current_debug_port = 0;
            if (debug_proxy)
                debug_proxy->close_all();

            if (stop_worker() == -1)
                return -1;

            return spawn_worker();
        }
        else if (type == msg::controlmsg::MSGTYPE_SHUTDOWN)
        {
            LOG_INFO << "Shutdown requested by worker.";
            return shutdown();
        }

        LOG_WARNING << "Unknown control message type: " << type;
        return 0;
    }

    /**
     * Managed shutdown of the worker. The supervisor ends up in TERMINATED.
     */
    int worker_supervisor::shutdown()
    {
        if (state == SUPERVISOR_STATE::TERMINATED)
            return 0;

        state = SUPERVISOR_STATE::SHUTTING_DOWN;
        current_debug_port = 0;

        const int res = stop_worker();

        if (debug_proxy)
            debug_proxy->close_all();

        state = SUPERVISOR_STATE::TERMINATED;
        notify("terminated");
        return res;
    }

    /**
     * Checks for an unplanned worker exit and runs crash recovery if so.
     * @return 0 on success. -1 on failure.
     */
    int worker_supervisor::check_worker()
    {
        if (!worker || state != SUPERVISOR_STATE::RUNNING)
            return 0;

        const int res = launcher.check_exited(*worker, false);
        if (res == 0)
            return 0;

        if (res == -1)
            LOG_ERROR << "Could not determine worker process status.";

        return recover_crash();
    }

    /**
     * Crash policy: never respawn straight away. Waits for the restart trigger
     * (file change or keypress) before starting a new worker.
     */
    int worker_supervisor::recover_crash()
    {
        state = SUPERVISOR_STATE::CRASHED;
        current_debug_port = 0;

        if (worker->control_fd != -1)
            close(worker->control_fd);
        worker.reset();

        if (debug_proxy)
            debug_proxy->close_all();

        LOG_WARNING << "Worker exited unexpectedly. Waiting for a file change or a keypress to restart.";
        notify("worker offline");

        if (!trigger)
        {
            LOG_ERROR << "No restart trigger configured.";
            return -1;
        }

        if (trigger() == -1)
            return -1;

        return spawn_worker();
    }

    /**
     * Records the terminal geometry and pushes it to the worker.
     */
    int worker_supervisor::set_geometry(const uint16_t rows, const uint16_t cols)
    {
        this->rows = rows;
        this->cols = cols;

        if (!worker || worker->control_fd == -1 || control_closed)
            return 0;

        std::string msg;
        msg::controlmsg::create_resize_message(msg, rows, cols);
        if (write(worker->control_fd, msg.data(), msg.size()) == -1)
        {
            LOG_ERROR << errno << ": Error sending resize message to worker.";
            return -1;
        }
        return 0;
    }

    /**
     * Waits for a control message from the worker and handles it.
     * @return 0 on success (including no message). -1 on failure.
     */
    int worker_supervisor::read_control_message(const int timeout_ms)
    {
        if (!worker || worker->control_fd == -1 || control_closed)
        {
            util::sleep(timeout_ms);
            return 0;
        }

        struct pollfd pfd = {worker->control_fd, POLLIN, 0};
        const int poll_res = poll(&pfd, 1, timeout_ms);
        if (poll_res == -1)
        {
            if (errno == EINTR)
                return 0;
            LOG_ERROR << errno << ": Control channel poll error.";
            return -1;
        }

        if (poll_res == 0 || !(pfd.revents & (POLLIN | POLLHUP | POLLERR)))
            return 0;

        char buf[msg::controlmsg::MAX_CONTROL_MSG_SIZE];
        const ssize_t n = recv(worker->control_fd, buf, sizeof(buf), 0);
        if (n <= 0)
        {
            // Worker side closed. Process exit is detected by check_worker().
            control_closed = true;
            return 0;
        }

        msg::controlmsg::controlmsg_parser parser;
        std::string type;
        if (parser.parse(std::string_view(buf, n)) == -1 || parser.extract_type(type) == -1)
            return 0;

        return handle_control_message(type);
    }

    void worker_supervisor::process_tunnel_events(tunnel::tunnel_server &tunnel, bool &fatal)
    {
        tunnel::tunnel_event event;
        while (tunnel.try_dequeue_event(event))
        {
            if (event.type == tunnel::TUNNEL_EVENT_TYPE::FATAL)
            {
                fatal = true;
            }
            else if (event.type == tunnel::TUNNEL_EVENT_TYPE::CONNECTED || event.type == tunnel::TUNNEL_EVENT_TYPE::RESIZE)
            {
                if (set_geometry(event.rows, event.cols) == -1)
                    LOG_WARNING << "Terminal geometry not delivered to the worker.";
            }
        }
    }

    /**
     * Supervisor main loop. Runs until the worker requests shutdown or a fatal error occurs.
     * @param tunnel Session tunnel whose events are processed. Can be NULL.
     * @return 0 on managed shutdown. -1 on fatal error.
     */
    int worker_supervisor::run(tunnel::tunnel_server *tunnel)
    {
        if (state == SUPERVISOR_STATE::NO_WORKER && start() == -1)
            return -1;

        while (state != SUPERVISOR_STATE::TERMINATED)
        {
            if (tunnel)
            {
                bool fatal = false;
                process_tunnel_events(*tunnel, fatal);
                if (fatal)
                {
                    LOG_ERROR << "Tunnel failed. Stopping.";
                    shutdown();
                    return -1;
                }
            }

            if (read_control_message(CONTROL_POLL_TIMEOUT) == -1 || check_worker() == -1)
            {
                shutdown();
                return -1;
            }
        }

        return 0;
    }

} // namespace supervisor
