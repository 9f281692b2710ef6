#ifndef _HC_SUPERVISOR_SUPERVISOR_
#define _HC_SUPERVISOR_SUPERVISOR_

#include "../pchheader.hpp"
#include "../proxy/debug_proxy.hpp"
#include "../tunnel/tunnel_server.hpp"
#include "process_launcher.hpp"

namespace supervisor
{
    enum SUPERVISOR_STATE
    {
        NO_WORKER,
        STARTING,
        RUNNING,
        RELOADING,
        SHUTTING_DOWN,
        CRASHED,
        TERMINATED
    };

    // Blocks until a worker restart should happen after a crash. Returns 0 to restart, -1 on error.
    typedef std::function<int()> restart_trigger;

    // Receives human readable lifecycle notifications (eg. "worker offline").
    typedef std::function<void(std::string_view)> state_listener;

    /**
     * Worker lifecycle state machine. Owns the worker debug port counter and the only
     * worker process at any time.
     */
    class worker_supervisor
    {
    private:
        process_launcher &launcher;
        proxy::debug_proxy *debug_proxy = NULL;
        restart_trigger trigger;
        std::vector<state_listener> listeners;

        SUPERVISOR_STATE state = SUPERVISOR_STATE::NO_WORKER;
        std::optional<worker_process> worker;
        uint16_t next_debug_port;
        std::atomic<uint16_t> current_debug_port = 0; // Published to the debug proxy. 0 while unknown.
        bool control_closed = false;

        uint16_t rows = 0;
        uint16_t cols = 0;

        int spawn_worker();
        int stop_worker();
        void notify(std::string_view message);
        int recover_crash();
        int read_control_message(const int timeout_ms);
        void process_tunnel_events(tunnel::tunnel_server &tunnel, bool &fatal);

    public:
        worker_supervisor(process_launcher &launcher, const uint16_t base_debug_port);
        const std::atomic<uint16_t> &debug_port() const;
        void attach_proxy(proxy::debug_proxy *debug_proxy);
        void set_restart_trigger(restart_trigger trigger);
        void add_listener(state_listener listener);
        int start();
        int handle_control_message(std::string_view type);
        int check_worker();
        int set_geometry(const uint16_t rows, const uint16_t cols);
        int run(tunnel::tunnel_server *tunnel);
        int shutdown();
        SUPERVISOR_STATE get_state() const;
        const std::optional<worker_process> &get_worker() const;
    };

} // namespace supervisor

#endif
