#include "../pchheader.hpp"
#include "../util/util.hpp"
#include "debug_proxy.hpp"

namespace proxy
{
    constexpr int POLL_TIMEOUT = 20;
    constexpr size_t FORWARD_BUFFER_SIZE = 64 * 1024;
    constexpr int LISTEN_BACKLOG = 16;

    debug_proxy::debug_proxy(const std::atomic<uint16_t> &worker_port) : worker_port(worker_port)
    {
    }

    debug_proxy::~debug_proxy()
    {
        deinit();
    }

    /**
     * Starts listening for debugger clients.
     * @param host Bind host.
     * @param port Bind port. 0 binds an ephemeral port (see listen_port()).
     * @param worker_host Host where the worker debug port is reachable.
     * @return 0 on success. -1 on failure.
     */
    int debug_proxy::init(std::string_view host, const uint16_t port, std::string_view worker_host)
    {
        this->worker_host = worker_host;

        struct sockaddr_in addr;
        if (util::resolve_ipv4(host, port, addr) == -1)
            return -1;

        listen_fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (listen_fd == -1)
        {
            LOG_ERROR << errno << ": Error creating debug proxy socket.";
            return -1;
        }

        const int reuse = 1;
        if (setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) == -1)
            LOG_WARNING << errno << ": Could not set SO_REUSEADDR on debug proxy socket.";

        if (bind(listen_fd, (struct sockaddr *)&addr, sizeof(addr)) == -1 || listen(listen_fd, LISTEN_BACKLOG) == -1)
        {
            LOG_ERROR << errno << ": Error binding debug proxy to " << host << ":" << port;
            close(listen_fd);
            listen_fd = -1;
            return -1;
        }

        struct sockaddr_in bound;
        socklen_t len = sizeof(bound);
        if (getsockname(listen_fd, (struct sockaddr *)&bound, &len) == -1)
        {
            LOG_ERROR << errno << ": Error reading debug proxy bound address.";
            close(listen_fd);
            listen_fd = -1;
            return -1;
        }
        bound_port = ntohs(bound.sin_port);

        proxy_thread = std::thread(&debug_proxy::proxy_loop, this);

        LOG_INFO << "Debug proxy listening on " << host << ":" << bound_port;
        return 0;
    }

    void debug_proxy::deinit()
    {
        if (listen_fd == -1)
            return;

        is_shutting_down = true;
        if (proxy_thread.joinable())
            proxy_thread.join();

        close_all();
        close(listen_fd);
        listen_fd = -1;
    }

    uint16_t debug_proxy::listen_port() const
    {
        return bound_port;
    }

    /**
     * Force-closes all tracked debugger connection pairs.
     * @return No. of pairs closed.
     */
    size_t debug_proxy::close_all()
    {
        std::scoped_lock lock(sessions_mutex);
        const size_t count = sessions.size();
        for (proxy_session &ps : sessions)
            close_session(ps);
        sessions.clear();
        sessions_epoch++;

        if (count > 0)
            LOG_DEBUG << "Closed " << count << " debugger connections.";
        return count;
    }

    size_t debug_proxy::pair_count()
    {
        std::scoped_lock lock(sessions_mutex);
        return sessions.size();
    }

    void debug_proxy::proxy_loop()
    {
        util::mask_signal();

        std::vector<struct pollfd> pfds;
        std::vector<proxy_session *> owners;

        while (!is_shutting_down)
        {
            uint64_t epoch = 0;
            {
                std::scoped_lock lock(sessions_mutex);
                epoch = sessions_epoch;

                pfds.clear();
                owners.clear();
                pfds.push_back({listen_fd, POLLIN, 0});
                owners.push_back(NULL);

                for (proxy_session &ps : sessions)
                {
                    if (ps.state == PROXY_STATE::CONNECTING)
                    {
                        pfds.push_back({ps.worker_fd, POLLOUT, 0});
                        owners.push_back(&ps);
                    }
                    else if (ps.state == PROXY_STATE::FORWARDING)
                    {
                        // A side is read only while the opposite pending buffer is empty. So a peer
                        // that stops reading stalls its source instead of growing the buffer.
                        const short client_events = (ps.to_worker.empty() ? POLLIN : 0) | (ps.to_client.empty() ? 0 : POLLOUT);
                        const short worker_events = (ps.to_client.empty() ? POLLIN : 0) | (ps.to_worker.empty() ? 0 : POLLOUT);
                        pfds.push_back({ps.client_fd, client_events, 0});
                        owners.push_back(&ps);
                        pfds.push_back({ps.worker_fd, worker_events, 0});
                        owners.push_back(&ps);
                    }
                }
            }

            // Polled without the lock so close_all() never waits on a poll cycle.
            if (poll(pfds.data(), pfds.size(), POLL_TIMEOUT) == -1)
            {
                if (errno == EINTR)
                    continue;
                LOG_ERROR << errno << ": Debug proxy poll error.";
                break;
            }

            std::scoped_lock lock(sessions_mutex);

            // close_all() ran during the poll. Polled sessions are gone.
            if (epoch == sessions_epoch)
            {
                for (size_t i = 1; i < pfds.size(); i++)
                {
                    proxy_session &ps = *owners[i];
                    const short revents = pfds[i].revents;
                    if (revents == 0 || ps.state == PROXY_STATE::CLOSED)
                        continue;

                    if (ps.state == PROXY_STATE::CONNECTING)
                    {
                        check_connected(ps);
                        continue;
                    }

                    const bool is_client = pfds[i].fd == ps.client_fd;
                    if (revents & POLLOUT)
                        flush(ps, is_client);

                    if (ps.state != PROXY_STATE::FORWARDING)
                        continue;

                    if ((revents & POLLERR) || ((revents & POLLHUP) && !(pfds[i].events & POLLIN)))
                        close_session(ps);
                    else if (revents & (POLLIN | POLLHUP))
                        forward(ps, is_client);
                }

                sessions.remove_if([](const proxy_session &ps) { return ps.state == PROXY_STATE::CLOSED; });
            }

            if (pfds[0].revents & POLLIN)
                accept_client();
        }
    }

    void debug_proxy::accept_client()
    {
        const int client_fd = accept4(listen_fd, NULL, NULL, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (client_fd == -1)
        {
            LOG_ERROR << errno << ": Error accepting debugger connection.";
            return;
        }

        const uint16_t port = worker_port.load();
        if (port == 0)
        {
            // No worker debug port known yet. Debugger clients retry on their own.
            LOG_DEBUG << "Debugger connection dropped. No worker debug port available.";
            close(client_fd);
            return;
        }

        proxy_session ps;
        ps.client_fd = client_fd;
        ps.worker_port = port;
        connect_worker(ps);
        if (ps.state != PROXY_STATE::CLOSED)
            sessions.push_back(ps);
    }

    void debug_proxy::connect_worker(proxy_session &ps)
    {
        struct sockaddr_in addr;
        if (util::resolve_ipv4(worker_host, ps.worker_port, addr) == -1)
        {
            close_session(ps);
            return;
        }

        ps.worker_fd = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
        if (ps.worker_fd == -1)
        {
            LOG_ERROR << errno << ": Error creating worker debug socket.";
            close_session(ps);
            return;
        }

        if (connect(ps.worker_fd, (struct sockaddr *)&addr, sizeof(addr)) == 0)
        {
            ps.state = PROXY_STATE::FORWARDING;
        }
        else if (errno == EINPROGRESS)
        {
            ps.state = PROXY_STATE::CONNECTING;
        }
        else if (errno == ECONNREFUSED)
        {
            LOG_DEBUG << "Worker debug port " << ps.worker_port << " refused connection.";
            close_session(ps);
        }
        else
        {
            LOG_ERROR << errno << ": Error connecting to worker debug port " << ps.worker_port;
            close_session(ps);
        }
    }

    void debug_proxy::check_connected(proxy_session &ps)
    {
        int err = 0;
        socklen_t len = sizeof(err);
        if (getsockopt(ps.worker_fd, SOL_SOCKET, SO_ERROR, &err, &len) == -1)
            err = errno;

        if (err == 0)
        {
            ps.state = PROXY_STATE::FORWARDING;
            LOG_DEBUG << "Debugger connection forwarded to worker port " << ps.worker_port;
        }
        else if (err == ECONNREFUSED)
        {
            // Worker may be between restarts.
            LOG_DEBUG << "Worker debug port " << ps.worker_port << " refused connection.";
            close_session(ps);
        }
        else
        {
            LOG_ERROR << err << ": Error connecting to worker debug port " << ps.worker_port;
            close_session(ps);
        }
    }

    /**
     * Reads available bytes from one side of the pair and passes them to the other side.
     * Whatever the destination socket does not accept right away is kept as pending output
     * and the source is not read again until it drains. Never blocks.
     * @param from_client True to forward client->worker. False for worker->client.
     */
    void debug_proxy::forward(proxy_session &ps, const bool from_client)
    {
        const int from_fd = from_client ? ps.client_fd : ps.worker_fd;
        std::string &pending = from_client ? ps.to_worker : ps.to_client;
        if (!pending.empty())
            return;

        char buf[FORWARD_BUFFER_SIZE];
        const ssize_t n = read(from_fd, buf, sizeof(buf));
        if (n == 0)
        {
            close_session(ps);
            return;
        }

        if (n == -1)
        {
            if (errno == EAGAIN || errno == EINTR)
                return;

            if (errno != ECONNRESET)
                LOG_ERROR << errno << ": Debug proxy read error.";
            close_session(ps);
            return;
        }

        pending.assign(buf, n);
        flush(ps, !from_client);
    }

    /**
     * Writes as much pending output as the destination socket accepts without blocking.
     * @param to_client True to flush the worker->client buffer. False for client->worker.
     */
    void debug_proxy::flush(proxy_session &ps, const bool to_client)
    {
        const int to_fd = to_client ? ps.client_fd : ps.worker_fd;
        std::string &pending = to_client ? ps.to_client : ps.to_worker;

        while (!pending.empty())
        {
            const ssize_t res = send(to_fd, pending.data(), pending.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
            if (res == -1)
            {
                if (errno == EINTR)
                    continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK)
                    return; // Resumed on POLLOUT.

                if (errno != ECONNRESET && errno != EPIPE)
                    LOG_ERROR << errno << ": Debug proxy write error.";
                close_session(ps);
                return;
            }
            pending.erase(0, res);
        }
    }

    void debug_proxy::close_session(proxy_session &ps)
    {
        if (ps.client_fd != -1)
            close(ps.client_fd);
        if (ps.worker_fd != -1)
            close(ps.worker_fd);
        ps.client_fd = ps.worker_fd = -1;
        ps.to_worker.clear();
        ps.to_client.clear();
        ps.state = PROXY_STATE::CLOSED;
    }

} // namespace proxy
