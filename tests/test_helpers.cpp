#include "test_helpers.hpp"

namespace testutil
{
    int capture_writer::write(std::string_view chunk)
    {
        std::scoped_lock lock(capture_mutex);
        data.append(chunk);
        return 0;
    }

    std::string capture_writer::str() const
    {
        std::scoped_lock lock(capture_mutex);
        return data;
    }

    void capture_writer::clear()
    {
        std::scoped_lock lock(capture_mutex);
        data.clear();
    }

    bool wait_until(const std::function<bool()> &condition, const int timeout_ms)
    {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (condition())
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return condition();
    }

    std::string make_temp_dir()
    {
        std::string tmpl = "/tmp/hotcon-test-XXXXXX";
        if (mkdtemp(tmpl.data()) == NULL)
            return {};
        return tmpl;
    }

    void remove_dir_tree(const std::string &path)
    {
        DIR *dir = opendir(path.c_str());
        if (dir)
        {
            struct dirent *en;
            while ((en = readdir(dir)))
            {
                if (strcmp(en->d_name, ".") == 0 || strcmp(en->d_name, "..") == 0)
                    continue;

                const std::string child = path + "/" + en->d_name;
                struct stat st;
                if (lstat(child.c_str(), &st) == 0 && S_ISDIR(st.st_mode))
                    remove_dir_tree(child);
                else
                    unlink(child.c_str());
            }
            closedir(dir);
        }
        rmdir(path.c_str());
    }

    int write_file(const std::string &path, std::string_view content)
    {
        const int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (fd == -1)
            return -1;
        const ssize_t res = write(fd, content.data(), content.size());
        close(fd);
        return res == (ssize_t)content.size() ? 0 : -1;
    }

    // Reads whatever arrives on the fd during the given time window.
    std::string read_for(const int fd, const int duration_ms)
    {
        std::string out;
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(duration_ms);
        while (true)
        {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0)
                break;

            struct pollfd pfd = {fd, POLLIN, 0};
            if (poll(&pfd, 1, remaining) <= 0 || !(pfd.revents & POLLIN))
                break;

            char buf[4096];
            const ssize_t n = read(fd, buf, sizeof(buf));
            if (n <= 0)
                break;
            out.append(buf, n);
        }
        return out;
    }

    // Reads until the needle shows up in the received data or the timeout expires.
    std::string read_until(const int fd, std::string_view needle, const int timeout_ms)
    {
        std::string out;
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (out.find(needle) == std::string::npos)
        {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0)
                break;

            struct pollfd pfd = {fd, POLLIN, 0};
            if (poll(&pfd, 1, remaining) <= 0)
                break;

            char buf[4096];
            const ssize_t n = read(fd, buf, sizeof(buf));
            if (n <= 0)
                break;
            out.append(buf, n);
        }
        return out;
    }

    // True if the peer closed the connection within the timeout.
    bool wait_eof(const int fd, const int timeout_ms)
    {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (true)
        {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0)
                return false;

            struct pollfd pfd = {fd, POLLIN, 0};
            if (poll(&pfd, 1, remaining) <= 0)
                return false;

            char buf[1024];
            const ssize_t n = read(fd, buf, sizeof(buf));
            if (n == 0 || (n == -1 && errno == ECONNRESET))
                return true;
            if (n == -1)
                return false;
        }
    }

    int listen_tcp(uint16_t &port)
    {
        const int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd == -1)
            return -1;

        struct sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = htons(port);

        const int reuse = 1;
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        socklen_t len = sizeof(addr);
        if (bind(fd, (struct sockaddr *)&addr, sizeof(addr)) == -1 || listen(fd, 8) == -1 ||
            getsockname(fd, (struct sockaddr *)&addr, &len) == -1)
        {
            close(fd);
            return -1;
        }

        port = ntohs(addr.sin_port);
        return fd;
    }

    int connect_tcp(const uint16_t port)
    {
        const int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd == -1)
            return -1;

        struct sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = htons(port);

        if (connect(fd, (struct sockaddr *)&addr, sizeof(addr)) == -1)
        {
            close(fd);
            return -1;
        }
        return fd;
    }

    // A port nobody listens on (bound once, then released).
    uint16_t unused_tcp_port()
    {
        uint16_t port = 0;
        const int fd = listen_tcp(port);
        if (fd != -1)
            close(fd);
        return port;
    }

    echo_server::echo_server()
    {
        listen_fd = listen_tcp(port);
        if (listen_fd != -1)
            server_thread = std::thread(&echo_server::serve, this);
    }

    echo_server::~echo_server()
    {
        is_shutting_down = true;
        if (server_thread.joinable())
            server_thread.join();
        if (listen_fd != -1)
            close(listen_fd);
    }

    uint16_t echo_server::get_port() const
    {
        return port;
    }

    void echo_server::serve()
    {
        std::vector<int> clients;
        while (!is_shutting_down)
        {
            std::vector<struct pollfd> pfds;
            pfds.push_back({listen_fd, POLLIN, 0});
            for (const int fd : clients)
                pfds.push_back({fd, POLLIN, 0});

            if (poll(pfds.data(), pfds.size(), 20) <= 0)
                continue;

            std::vector<int> remaining;
            for (size_t i = 1; i < pfds.size(); i++)
            {
                if (pfds[i].revents == 0)
                {
                    remaining.push_back(pfds[i].fd);
                    continue;
                }

                char buf[4096];
                const ssize_t n = read(pfds[i].fd, buf, sizeof(buf));
                if (n <= 0 || write(pfds[i].fd, buf, n) != n)
                    close(pfds[i].fd);
                else
                    remaining.push_back(pfds[i].fd);
            }
            clients = remaining;

            if (pfds[0].revents & POLLIN)
            {
                const int fd = accept(listen_fd, NULL, NULL);
                if (fd != -1)
                    clients.push_back(fd);
            }
        }

        for (const int fd : clients)
            close(fd);
    }

    flood_server::flood_server()
    {
        listen_fd = listen_tcp(port);
        if (listen_fd != -1)
            server_thread = std::thread(&flood_server::serve, this);
    }

    flood_server::~flood_server()
    {
        is_shutting_down = true;
        if (server_thread.joinable())
            server_thread.join();
        if (listen_fd != -1)
            close(listen_fd);
    }

    uint16_t flood_server::get_port() const
    {
        return port;
    }

    size_t flood_server::bytes_sent() const
    {
        return sent;
    }

    void flood_server::serve()
    {
        int fd = -1;
        while (!is_shutting_down && fd == -1)
        {
            struct pollfd pfd = {listen_fd, POLLIN, 0};
            if (poll(&pfd, 1, 20) > 0 && (pfd.revents & POLLIN))
                fd = accept4(listen_fd, NULL, NULL, SOCK_NONBLOCK);
        }

        const std::string block(64 * 1024, 'x');
        while (!is_shutting_down && fd != -1)
        {
            struct pollfd pfd = {fd, POLLOUT, 0};
            if (poll(&pfd, 1, 20) <= 0)
                continue;

            const ssize_t n = send(fd, block.data(), block.size(), MSG_NOSIGNAL);
            if (n == -1 && (errno == EAGAIN || errno == EINTR))
                continue;
            if (n <= 0)
                break;
            sent += n;
        }

        if (fd != -1)
            close(fd);
    }

} // namespace testutil
