#include "../pchheader.hpp"
#include "../util/util.hpp"
#include "repl_host.hpp"

namespace repl
{
    constexpr uint32_t STOP_CHECK_INTERVAL = 50;

    const std::string make_prompt(const pid_t pid, std::string_view app_name)
    {
        std::string prompt;
        prompt.append("(").append(std::to_string(pid)).append(") hotcon/").append(app_name).append(" >> ");
        return prompt;
    }

    repl_host::repl_host(const repl_options &options, console::prompt_coordinator &coordinator, line_editor &editor,
                         evaluator &eval, history &hist, std::function<void()> shutdown_handler)
        : options(options),
          prompt(make_prompt(getpid(), options.app_name)),
          coordinator(coordinator),
          editor(editor),
          eval(eval),
          hist(hist),
          shutdown_handler(std::move(shutdown_handler))
    {
    }

    /**
     * Connects to the tunnel endpoint. Retries until connected or stopped.
     * @return Connected socket fd. -1 if stopped.
     */
    int repl_host::connect_tunnel()
    {
        struct sockaddr_un addr;
        memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        strncpy(addr.sun_path, options.socket_path.c_str(), sizeof(addr.sun_path) - 1);

        while (!is_shutting_down)
        {
            for (uint32_t waited = 0; waited < options.connect_delay_ms && !is_shutting_down; waited += STOP_CHECK_INTERVAL)
                util::sleep(MIN(STOP_CHECK_INTERVAL, options.connect_delay_ms - waited));

            if (is_shutting_down)
                break;

            const int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
            if (fd == -1)
            {
                LOG_ERROR << errno << ": Error creating console socket.";
                return -1;
            }

            if (connect(fd, (struct sockaddr *)&addr, sizeof(addr)) == 0)
                return fd;

            LOG_DEBUG << errno << ": Console connect to " << options.socket_path << " failed. Retrying.";
            close(fd);
        }
        return -1;
    }

    /**
     * Reads and evaluates lines until the session ends.
     * @return OPERATOR_EXIT or SOCKET_END.
     */
    int repl_host::run_session()
    {
        std::string line;
        while (true)
        {
            const int res = editor.read_line(prompt, line);
            if (res != LINE_SUBMITTED)
                return res;

            hist.add(line);

            const size_t begin = line.find_first_not_of(" \t");
            if (begin != std::string::npos && line.compare(begin, line.find_last_not_of(" \t") - begin + 1, ".exit") == 0)
                return OPERATOR_EXIT;

            std::string output;
            if (eval.eval(line, output) == -1)
                LOG_DEBUG << "Evaluation failed for input: " << line;

            if (!output.empty() && editor.write_output(output) == -1)
                return SOCKET_END;
        }
    }

    /**
     * Runs console sessions until the operator exits.
     * @return 0 on operator exit. -1 if stopped or failed.
     */
    int repl_host::run()
    {
        while (!is_shutting_down)
        {
            const int fd = connect_tunnel();
            if (fd == -1)
                return -1;

            session_fd = fd;
            if (hist.load(options.history_file) == -1)
                LOG_DEBUG << "Starting with an empty history.";

            editor.attach(fd);
            coordinator.set_closing(false);

            const int res = run_session();

            coordinator.set_closing(true);
            editor.detach();
            session_fd = -1;
            close(fd);

            if (save_history() == -1)
                LOG_WARNING << "Console history was not saved.";

            if (res == OPERATOR_EXIT)
            {
                LOG_INFO << "Console exit requested. Shutting down.";
                if (shutdown_handler)
                    shutdown_handler();
                return 0;
            }

            if (!is_shutting_down)
                LOG_DEBUG << "Console connection ended. Reconnecting.";
        }
        return -1;
    }

    void repl_host::stop()
    {
        is_shutting_down = true;

        // Unblock a pending socket read.
        const int fd = session_fd;
        if (fd != -1)
            ::shutdown(fd, SHUT_RDWR);
    }

    int repl_host::save_history()
    {
        return hist.save(options.history_file);
    }

} // namespace repl
