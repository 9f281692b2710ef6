#include "../pchheader.hpp"
#include "../util/util.hpp"
#include "tty.hpp"
#include "tunnel_server.hpp"

namespace tunnel
{
    constexpr size_t RELAY_BUFFER_SIZE = 16 * 1024;
    constexpr char WAKE_RESIZE = 'r';
    constexpr char WAKE_QUIT = 'q';

    // Write end of the self-pipe of the tunnel which receives SIGWINCH.
    std::atomic<int> winch_fd = -1;

    /**
     * SIGWINCH handler. Only performs an async-signal-safe write to the tunnel self-pipe.
     */
    void handle_winch(int signum)
    {
        const int fd = winch_fd.load();
        if (fd != -1)
        {
            const int saved_errno = errno;
            const ssize_t res = write(fd, &WAKE_RESIZE, 1);
            (void)res;
            errno = saved_errno;
        }
    }

    tunnel_server::tunnel_server() : events(16)
    {
    }

    tunnel_server::~tunnel_server()
    {
        deinit();
    }

    /**
     * Verifies the operator terminal, replaces any stale socket file and starts listening.
     * @param socket_path Filesystem path of the unix socket endpoint.
     * @param in_fd Operator terminal input fd.
     * @param out_fd Operator terminal output fd.
     * @return 0 on success. -1 on failure.
     */
    int tunnel_server::init(std::string_view socket_path, const int in_fd, const int out_fd)
    {
        if (tty::check_terminal(in_fd) == -1)
        {
            LOG_ERROR << "The console requires an interactive terminal with raw mode support. "
                      << "Run hotcon directly from a terminal (not through a pipe or redirection).";
            return -1;
        }

        this->socket_path = socket_path;
        this->in_fd = in_fd;
        this->out_fd = out_fd;

        struct sockaddr_un addr;
        memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        if (this->socket_path.size() >= sizeof(addr.sun_path))
        {
            LOG_ERROR << "Tunnel socket path too long: " << this->socket_path;
            return -1;
        }
        strncpy(addr.sun_path, this->socket_path.c_str(), sizeof(addr.sun_path) - 1);

        // Remove stale socket left behind by a previous run.
        struct stat st;
        if (lstat(this->socket_path.c_str(), &st) == 0)
        {
            if (!S_ISSOCK(st.st_mode))
            {
                LOG_ERROR << "Tunnel socket path " << this->socket_path << " exists and is not a socket.";
                return -1;
            }

            if (unlink(this->socket_path.c_str()) == -1)
            {
                LOG_ERROR << errno << ": Error removing stale tunnel socket " << this->socket_path;
                return -1;
            }
            LOG_DEBUG << "Removed stale tunnel socket " << this->socket_path;
        }

        listen_fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (listen_fd == -1)
        {
            LOG_ERROR << errno << ": Error creating tunnel socket.";
            return -1;
        }

        if (bind(listen_fd, (struct sockaddr *)&addr, sizeof(addr)) == -1 || listen(listen_fd, 1) == -1)
        {
            LOG_ERROR << errno << ": Error binding tunnel socket " << this->socket_path;
            close(listen_fd);
            listen_fd = -1;
            return -1;
        }

        if (pipe2(wake_fds, O_CLOEXEC | O_NONBLOCK) == -1)
        {
            LOG_ERROR << errno << ": Error creating tunnel wake pipe.";
            close(listen_fd);
            listen_fd = -1;
            unlink(this->socket_path.c_str());
            return -1;
        }
        winch_fd = wake_fds[1];

        relay_thread = std::thread(&tunnel_server::relay_loop, this);

        LOG_INFO << "Tunnel listening at " << this->socket_path;
        return 0;
    }

    void tunnel_server::deinit()
    {
        if (listen_fd == -1)
            return;

        is_shutting_down = true;
        if (write(wake_fds[1], &WAKE_QUIT, 1) == -1)
            LOG_ERROR << errno << ": Error waking tunnel relay.";

        if (relay_thread.joinable())
            relay_thread.join();

        // Session cleanup also restores the terminal mode.
        if (current)
            close_session();

        if (winch_fd == wake_fds[1])
            winch_fd = -1;
        close(wake_fds[0]);
        close(wake_fds[1]);
        wake_fds[0] = wake_fds[1] = -1;

        close(listen_fd);
        listen_fd = -1;
        unlink(socket_path.c_str());

        LOG_DEBUG << "Tunnel stopped.";
    }

    bool tunnel_server::is_idle() const
    {
        return idle;
    }

    bool tunnel_server::try_dequeue_event(tunnel_event &event)
    {
        return events.try_dequeue(event);
    }

    /**
     * Reports a terminal resize to the relay thread. Same effect as a SIGWINCH.
     */
    void tunnel_server::notify_resize()
    {
        if (wake_fds[1] != -1 && write(wake_fds[1], &WAKE_RESIZE, 1) == -1 && errno != EAGAIN)
            LOG_ERROR << errno << ": Error signalling tunnel resize.";
    }

    void tunnel_server::push_event(const TUNNEL_EVENT_TYPE type)
    {
        tunnel_event event;
        event.type = type;
        if (current)
        {
            event.rows = current->rows;
            event.cols = current->cols;
        }
        events.enqueue(event);
    }

    void tunnel_server::relay_loop()
    {
        util::mask_signal();

        while (!is_shutting_down)
        {
            // The listener is only polled while there is no session so extra clients stay queued.
            struct pollfd pfds[3];
            nfds_t nfds = 0;
            pfds[nfds++] = {wake_fds[0], POLLIN, 0};
            if (current)
            {
                pfds[nfds++] = {current->fd, POLLIN, 0};
                pfds[nfds++] = {in_fd, POLLIN, 0};
            }
            else
            {
                pfds[nfds++] = {listen_fd, POLLIN, 0};
            }

            if (poll(pfds, nfds, -1) == -1)
            {
                if (errno == EINTR)
                    continue;
                LOG_ERROR << errno << ": Tunnel poll error.";
                push_event(TUNNEL_EVENT_TYPE::FATAL);
                break;
            }

            if (pfds[0].revents & POLLIN)
            {
                char wake_buf[32];
                const ssize_t n = read(wake_fds[0], wake_buf, sizeof(wake_buf));
                if (n > 0 && memchr(wake_buf, WAKE_QUIT, n) != NULL)
                    break;

                if (n > 0 && current)
                {
                    tty::get_geometry(in_fd, current->rows, current->cols);
                    push_event(TUNNEL_EVENT_TYPE::RESIZE);
                }
            }

            if (!current)
            {
                if ((pfds[1].revents & POLLIN) && accept_session() == -1)
                {
                    push_event(TUNNEL_EVENT_TYPE::FATAL);
                    break;
                }
                continue;
            }

            // Operator terminal hung up (eg. ssh drop). Nothing more can be relayed.
            if (pfds[2].revents & (POLLHUP | POLLERR | POLLNVAL))
            {
                LOG_ERROR << "Operator terminal closed.";
                push_event(TUNNEL_EVENT_TYPE::FATAL);
                break;
            }

            // Worker output to the operator terminal.
            int res = 0;
            if (pfds[1].revents & (POLLIN | POLLHUP | POLLERR))
                res = relay(current->fd, out_fd, true);

            // Operator keystrokes to the worker.
            if (res == 0 && (pfds[2].revents & POLLIN))
                res = relay(in_fd, current->fd, false);

            if (res == -1)
            {
                close_session();
            }
            else if (res == -2)
            {
                push_event(TUNNEL_EVENT_TYPE::FATAL);
                break;
            }
        }
    }

    /**
     * Accepts the next worker connection and switches the terminal into raw mode.
     * @return 0 on success (or a transient accept error). -1 when raw mode could not be entered.
     */
    int tunnel_server::accept_session()
    {
        const int fd = accept4(listen_fd, NULL, NULL, SOCK_CLOEXEC);
        if (fd == -1)
        {
            LOG_ERROR << errno << ": Error accepting tunnel connection.";
            return 0;
        }

        if (tty::enter_raw_mode(in_fd, saved_mode) == -1)
        {
            LOG_ERROR << "Terminal raw mode is not supported. The console cannot be used from this terminal.";
            close(fd);
            return -1;
        }
        is_raw = true;

        session s;
        s.fd = fd;
        tty::get_geometry(in_fd, s.rows, s.cols);
        current = s;
        idle = false;

        LOG_DEBUG << "Tunnel session opened (" << s.cols << "x" << s.rows << ").";
        push_event(TUNNEL_EVENT_TYPE::CONNECTED);
        return 0;
    }

    void tunnel_server::close_session()
    {
        current->state = SESSION_STATE::CLOSING;
        close(current->fd);

        if (is_raw)
        {
            if (tty::restore_mode(in_fd, saved_mode) == -1)
                LOG_WARNING << "Terminal mode could not be restored.";
            is_raw = false;
        }

        push_event(TUNNEL_EVENT_TYPE::DISCONNECTED);
        current.reset();
        idle = true;

        LOG_DEBUG << "Tunnel session closed.";
    }

    /**
     * Moves one chunk of bytes between the given fds.
     * @return 0 on success. -1 when the session has ended. -2 when the operator terminal is lost.
     */
    int tunnel_server::relay(const int from_fd, const int to_fd, const bool from_session)
    {
        char buf[RELAY_BUFFER_SIZE];
        const ssize_t n = read(from_fd, buf, sizeof(buf));
        if (n == 0)
        {
            if (from_session)
                return -1;

            // Raw mode has no EOF character. A zero read means the terminal hung up.
            LOG_ERROR << "Operator terminal closed.";
            return -2;
        }

        if (n == -1)
        {
            if (errno == EINTR || errno == EAGAIN)
                return 0;

            if (from_session)
            {
                if (errno != ECONNRESET)
                    LOG_ERROR << errno << ": Error reading from tunnel session.";
                return -1;
            }

            LOG_ERROR << errno << ": Error reading from terminal.";
            return -2;
        }

        if (util::write_to_fd(to_fd, std::string_view(buf, n)) == -1)
        {
            if (!from_session)
                return -1; // Worker end is gone.

            LOG_ERROR << errno << ": Error writing to terminal.";
            return -2;
        }
        return 0;
    }

} // namespace tunnel
