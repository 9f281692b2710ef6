#include "../pchheader.hpp"
#include "../util/util.hpp"
#include "inspector.hpp"

namespace worker
{
    constexpr int POLL_TIMEOUT = 50;
    constexpr size_t READ_BUFFER_SIZE = 4096;
    constexpr size_t MAX_LINE_SIZE = 64 * 1024;

    inspector::inspector(repl::evaluator &eval) : eval(eval)
    {
    }

    inspector::~inspector()
    {
        deinit();
    }

    int inspector::init(std::string_view host, const uint16_t port)
    {
        struct sockaddr_in addr;
        if (util::resolve_ipv4(host, port, addr) == -1)
            return -1;

        listen_fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (listen_fd == -1)
        {
            LOG_ERROR << errno << ": Error creating inspector socket.";
            return -1;
        }

        const int reuse = 1;
        if (setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) == -1)
            LOG_WARNING << errno << ": Could not set SO_REUSEADDR on inspector socket.";

        struct sockaddr_in bound;
        socklen_t len = sizeof(bound);
        if (bind(listen_fd, (struct sockaddr *)&addr, sizeof(addr)) == -1 ||
            listen(listen_fd, 8) == -1 ||
            getsockname(listen_fd, (struct sockaddr *)&bound, &len) == -1)
        {
            LOG_ERROR << errno << ": Error binding inspector to " << host << ":" << port;
            close(listen_fd);
            listen_fd = -1;
            return -1;
        }
        bound_port = ntohs(bound.sin_port);

        inspector_thread = std::thread(&inspector::inspector_loop, this);

        LOG_DEBUG << "Inspector listening on " << host << ":" << bound_port;
        return 0;
    }

    void inspector::deinit()
    {
        if (listen_fd == -1)
            return;

        is_shutting_down = true;
        if (inspector_thread.joinable())
            inspector_thread.join();

        for (const inspector_client &client : clients)
            close(client.fd);
        clients.clear();

        close(listen_fd);
        listen_fd = -1;
    }

    uint16_t inspector::listen_port() const
    {
        return bound_port;
    }

    void inspector::inspector_loop()
    {
        util::mask_signal();

        std::vector<struct pollfd> pfds;
        while (!is_shutting_down)
        {
            pfds.clear();
            pfds.push_back({listen_fd, POLLIN, 0});
            for (const inspector_client &client : clients)
                pfds.push_back({client.fd, POLLIN, 0});

            if (poll(pfds.data(), pfds.size(), POLL_TIMEOUT) == -1)
            {
                if (errno == EINTR)
                    continue;
                LOG_ERROR << errno << ": Inspector poll error.";
                break;
            }

            auto itr = clients.begin();
            for (size_t i = 1; i < pfds.size(); i++)
            {
                if (pfds[i].revents != 0 && handle_client(*itr) == -1)
                {
                    close(itr->fd);
                    itr = clients.erase(itr);
                }
                else
                {
                    itr++;
                }
            }

            if (pfds[0].revents & POLLIN)
            {
                const int fd = accept4(listen_fd, NULL, NULL, SOCK_CLOEXEC);
                if (fd == -1)
                {
                    LOG_ERROR << errno << ": Error accepting inspector connection.";
                }
                else
                {
                    inspector_client client;
                    client.fd = fd;
                    clients.push_back(std::move(client));
                    LOG_DEBUG << "Inspector client connected.";
                }
            }
        }
    }

    /**
     * Reads from the client and evaluates all complete lines.
     * @return 0 to keep the client. -1 to drop it.
     */
    int inspector::handle_client(inspector_client &client)
    {
        char buf[READ_BUFFER_SIZE];
        const ssize_t n = read(client.fd, buf, sizeof(buf));
        if (n <= 0)
        {
            if (n == -1 && errno != ECONNRESET)
                LOG_ERROR << errno << ": Inspector read error.";
            return -1;
        }

        client.inbuf.append(buf, n);

        size_t pos;
        while ((pos = client.inbuf.find('\n')) != std::string::npos)
        {
            std::string line = client.inbuf.substr(0, pos);
            client.inbuf.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();

            std::string output;
            if (eval.eval(line, output) == -1)
                LOG_DEBUG << "Inspector evaluation failed for input: " << line;

            if (!output.empty() && util::write_to_fd(client.fd, output) == -1)
                return -1;
        }

        if (client.inbuf.size() > MAX_LINE_SIZE)
        {
            LOG_WARNING << "Inspector input line too long. Dropping client.";
            return -1;
        }
        return 0;
    }

} // namespace worker
