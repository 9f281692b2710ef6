#ifndef _HC_PROXY_DEBUG_PROXY_
#define _HC_PROXY_DEBUG_PROXY_

#include "../pchheader.hpp"

namespace proxy
{
    enum PROXY_STATE
    {
        CONNECTING, // Connection to the worker debug port in progress.
        FORWARDING, // Bytes are spliced in both directions.
        CLOSED
    };

    // An external debugger client linked with a connection to the worker debug port.
    struct proxy_session
    {
        int client_fd = -1;
        int worker_fd = -1;
        uint16_t worker_port = 0;
        PROXY_STATE state = PROXY_STATE::CONNECTING;
        std::string to_worker; // Bytes read from the client not yet accepted by the worker socket.
        std::string to_client; // Bytes read from the worker not yet accepted by the client socket.
    };

    /**
     * Exposes a fixed local port for debugger clients and forwards each accepted connection
     * to the debug port of the current worker.
     */
    class debug_proxy
    {
    private:
        const std::atomic<uint16_t> &worker_port; // Debug port of the current worker. 0 if unknown.
        std::string worker_host;
        int listen_fd = -1;
        uint16_t bound_port = 0;

        std::list<proxy_session> sessions;
        std::mutex sessions_mutex;
        uint64_t sessions_epoch = 0; // Bumped by close_all(). Guarded by sessions_mutex.
        std::atomic<bool> is_shutting_down = false;
        std::thread proxy_thread;

        void proxy_loop();
        void accept_client();
        void connect_worker(proxy_session &ps);
        void check_connected(proxy_session &ps);
        void forward(proxy_session &ps, const bool from_client);
        void flush(proxy_session &ps, const bool to_client);
        void close_session(proxy_session &ps);

    public:
        explicit debug_proxy(const std::atomic<uint16_t> &worker_port);
        ~debug_proxy();
        int init(std::string_view host, const uint16_t port, std::string_view worker_host);
        void deinit();
        size_t close_all();
        size_t pair_count();
        uint16_t listen_port() const;
    };

} // namespace proxy

#endif
