#include "../pchheader.hpp"
#include "../util/util.hpp"
#include "process_launcher.hpp"

namespace supervisor
{
    constexpr uint32_t EXIT_CHECK_INTERVAL = 20;

    posix_launcher::posix_launcher(std::string_view exe_path, std::string_view app_dir, const uint32_t grace_period_ms)
        : exe_path(exe_path), app_dir(app_dir), grace_period_ms(grace_period_ms)
    {
    }

    int posix_launcher::spawn(worker_process &worker)
    {
        // Control channel between the supervisor and the worker.
        int fds[2];
        if (socketpair(AF_UNIX, SOCK_SEQPACKET, 0, fds) == -1)
        {
            LOG_ERROR << errno << ": Error initializing control socket pair.";
            return -1;
        }

        // Supervisor end must not leak into the worker.
        if (fcntl(fds[1], F_SETFD, FD_CLOEXEC) == -1)
        {
            LOG_ERROR << errno << ": Error setting close-on-exec on control socket.";
            close(fds[0]);
            close(fds[1]);
            return -1;
        }

        const pid_t pid = fork();
        if (pid == -1)
        {
            LOG_ERROR << errno << ": Error forking worker process.";
            close(fds[0]);
            close(fds[1]);
            return -1;
        }
        else if (pid > 0)
        {
            // Close child end of socket.
            close(fds[0]);
            worker.pid = pid;
            worker.control_fd = fds[1];
            return 0;
        }

        // Child process.
        util::fork_detach();

        // Keystrokes belong to the tunnel. The worker reads its input from the socket.
        const int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd == -1 || dup2(null_fd, STDIN_FILENO) == -1)
        {
            std::cerr << errno << ": Worker stdin redirection failed.\n";
            exit(1);
        }
        close(null_fd);

        std::string fd_str = std::to_string(fds[0]);
        std::string port_str = std::to_string(worker.debug_port);

        char *argv[] = {(char *)exe_path.data(), (char *)"worker", (char *)app_dir.data(), fd_str.data(), port_str.data(), NULL};
        execv(argv[0], argv);

        std::cerr << errno << ": Error executing worker process.\n";
        exit(1);
    }

    /**
     * Sends SIGTERM and waits for the grace period before escalating to SIGKILL.
     */
    int posix_launcher::terminate(worker_process &worker)
    {
        if (worker.pid <= 0)
            return 0;

        worker.state = WORKER_STATE::EXITING;

        int ret = 0;
        if (kill(worker.pid, SIGTERM) == -1 && errno != ESRCH)
        {
            LOG_ERROR << errno << ": Error issuing SIGTERM to worker pid " << worker.pid;
            ret = -1;
        }

        uint32_t waited = 0;
        int exited = check_exited(worker, false);
        while (exited == 0 && waited < grace_period_ms)
        {
            util::sleep(EXIT_CHECK_INTERVAL);
            waited += EXIT_CHECK_INTERVAL;
            exited = check_exited(worker, false);
        }

        if (exited == 0)
        {
            LOG_WARNING << "Worker pid " << worker.pid << " did not exit in time. Killing.";
            if (kill(worker.pid, SIGKILL) == -1)
            {
                LOG_ERROR << errno << ": Error issuing SIGKILL to worker pid " << worker.pid;
                ret = -1;
            }
            else if (check_exited(worker, true) == -1)
            {
                ret = -1;
            }
        }
        else if (exited == -1)
        {
            ret = -1;
        }

        if (worker.control_fd != -1)
        {
            close(worker.control_fd);
            worker.control_fd = -1;
        }

        return ret;
    }

    int posix_launcher::check_exited(worker_process &worker, const bool block)
    {
        if (worker.pid <= 0)
            return 1;

        int status = 0;
        const int wait_res = waitpid(worker.pid, &status, block ? 0 : WNOHANG);

        if (wait_res == 0) // Child still running.
        {
            return 0;
        }
        if (wait_res == -1)
        {
            LOG_ERROR << errno << ": Worker process waitpid error. pid:" << worker.pid;
            worker.pid = 0;
            return -1;
        }
        else // Child has exited
        {
            if (WIFEXITED(status))
                LOG_DEBUG << "Worker pid " << worker.pid << " exited with code " << WEXITSTATUS(status);
            else if (WIFSIGNALED(status))
                LOG_DEBUG << "Worker pid " << worker.pid << " terminated by signal " << WTERMSIG(status);

            worker.pid = 0;
            return 1;
        }
    }

} // namespace supervisor
