/**
    Entry point for hotcon
**/

#include "pchheader.hpp"
#include "util/version.hpp"
#include "util/util.hpp"
#include "util/writer.hpp"
#include "conf.hpp"
#include "hclog.hpp"
#include "tunnel/tty.hpp"
#include "tunnel/tunnel_server.hpp"
#include "proxy/debug_proxy.hpp"
#include "supervisor/process_launcher.hpp"
#include "supervisor/supervisor.hpp"
#include "supervisor/restart_trigger.hpp"
#include "worker/worker.hpp"

// Supervisor subsystems. Kept here so the signal handler can tear them down.
std::unique_ptr<util::fd_writer> log_writer;
std::unique_ptr<tunnel::tunnel_server> tunnel_srv;
std::unique_ptr<supervisor::posix_launcher> launcher;
std::unique_ptr<supervisor::worker_supervisor> worker_sv;
std::unique_ptr<proxy::debug_proxy> dbg_proxy;

// Worker process arguments.
int worker_control_fd = -1;
uint16_t worker_debug_port = 0;

/**
 * Parses CLI args and extracts hotcon command and parameters given.
 * hotcon accepts a command and the application directory (plus internal worker arguments).
 */
int parse_cmd(int argc, char **argv)
{
    if (argc > 1)
    {
        // We populate the global console ctx with the detected command.
        conf::ctx.command = argv[1];

        // For run/new, app directory argument must be specified.

        if (conf::ctx.command == "run" || conf::ctx.command == "new")
        {
            if (argc != 3)
            {
                std::cerr << "Application directory not specified.\n";
            }
            else
            {
                // We inform the conf subsystem to populate the app directory context values
                // based on the directory argument from the command line.
                conf::set_app_dir_paths(argv[0], argv[2]);

                return 0;
            }
        }
        else if (conf::ctx.command == "worker")
        {
            // Internal command used by the supervisor to launch workers.
            uint64_t fd = 0, port = 0;
            if (argc == 5 && util::stoull(argv[3], fd) == 0 && util::stoull(argv[4], port) == 0 && port <= UINT16_MAX)
            {
                conf::set_app_dir_paths(argv[0], argv[2]);
                worker_control_fd = fd;
                worker_debug_port = port;
                return 0;
            }
        }
        else if (conf::ctx.command == "version")
        {
            if (argc == 2)
                return 0;
        }
    }

    // If all extractions fail display help message.

    std::cerr << "Arguments mismatch.\n";
    std::cout << "Usage:\n";
    std::cout << "hotcon version\n";
    std::cout << "hotcon <command> <app dir> (command = run | new)\n";
    std::cout << "Example: hotcon run ~/myapp\n";

    return -1;
}

/**
 * Performs any cleanup on graceful application termination.
 */
void deinit()
{
    if (conf::ctx.command == "worker")
    {
        worker::deinit();
    }
    else
    {
        // Worker goes first so it exits as a managed exit.
        if (worker_sv && worker_sv->shutdown() == -1)
            LOG_ERROR << "Worker was not stopped cleanly.";

        if (dbg_proxy)
            dbg_proxy->deinit();

        // Restores the terminal mode as well.
        if (tunnel_srv)
            tunnel_srv->deinit();

        // A crash-recovery keypress wait may still hold the terminal in raw mode.
        if (tty::restore_pending() == -1)
            LOG_WARNING << "Terminal mode could not be restored.";
    }

    conf::deinit();
}

void sig_exit_handler(int signum)
{
    LOG_WARNING << "Interrupt signal (" << signum << ") received.";
    deinit();
    LOG_WARNING << "hotcon exited due to signal.";
    exit(signum);
}

void segfault_handler(int signum)
{
    std::cerr << boost::stacktrace::stacktrace() << "\n";
    exit(SIGABRT);
}

/**
 * Global exception handler for std exceptions.
 */
void std_terminate() noexcept
{
    std::exception_ptr exptr = std::current_exception();
    if (exptr != 0)
    {
        try
        {
            std::rethrow_exception(exptr);
        }
        catch (std::exception &ex)
        {
            LOG_ERROR << "std error: " << ex.what();
        }
        catch (...)
        {
            LOG_ERROR << "std error: Terminated due to unknown exception";
        }
    }
    else
    {
        LOG_ERROR << "std error: Terminated due to unknown reason";
    }

    LOG_ERROR << boost::stacktrace::stacktrace();

    exit(1);
}

/**
 * Runs the supervisor: tunnel, debug proxy and the worker lifecycle state machine.
 * @return Process exit code.
 */
int run_supervisor()
{
    log_writer = std::make_unique<util::fd_writer>(STDERR_FILENO);
    hclog::init("hcs", "hotcon.log", *log_writer);

    LOG_INFO << "hotcon " << version::HC_VERSION;
    LOG_INFO << "App: " << conf::cfg.app.name << " (" << conf::ctx.app_dir << ")";

    tunnel_srv = std::make_unique<tunnel::tunnel_server>();
    if (tunnel_srv->init(conf::ctx.socket_path, STDIN_FILENO, STDOUT_FILENO) == -1)
    {
        deinit();
        return 1;
    }
    signal(SIGWINCH, &tunnel::handle_winch);

    launcher = std::make_unique<supervisor::posix_launcher>(conf::ctx.exe_path, conf::ctx.app_dir);
    worker_sv = std::make_unique<supervisor::worker_supervisor>(*launcher, conf::cfg.debug.worker_base_port);

    // Proxy reads the worker debug port owned by the supervisor.
    dbg_proxy = std::make_unique<proxy::debug_proxy>(worker_sv->debug_port());
    if (dbg_proxy->init(conf::ctx.debug_host, conf::ctx.debug_port, conf::ctx.debug_host) == -1)
    {
        deinit();
        return 1;
    }

    worker_sv->attach_proxy(dbg_proxy.get());
    worker_sv->set_restart_trigger([]() {
        return supervisor::wait_for_restart(conf::ctx.watch_paths, STDIN_FILENO, tunnel_srv.get());
    });
    worker_sv->add_listener([](std::string_view state) {
        if (state == "worker offline")
            LOG_INFO << "Worker offline. Press any key or change a watched file to restart it.";
    });

    // After initializing primary subsystems, register the exit handler.
    signal(SIGINT, &sig_exit_handler);
    signal(SIGTERM, &sig_exit_handler);

    const int res = worker_sv->run(tunnel_srv.get());

    deinit();
    return res == 0 ? 0 : 1;
}

/**
 * Runs a worker process spawned by the supervisor.
 * @return Process exit code.
 */
int run_worker()
{
    if (worker::init(worker_control_fd, worker_debug_port) == -1)
    {
        deinit();
        return 1;
    }

    signal(SIGINT, &sig_exit_handler);
    signal(SIGTERM, &sig_exit_handler);

    const int res = worker::run();

    deinit();
    return res == 0 ? 0 : 1;
}

int main(int argc, char **argv)
{
    // Register exception and segfault handlers.
    std::set_terminate(&std_terminate);
    signal(SIGSEGV, &segfault_handler);
    signal(SIGABRT, &segfault_handler);

    // Disable SIGPIPE to avoid crashing on broken pipe IO.
    {
        sigset_t mask;
        sigemptyset(&mask);
        sigaddset(&mask, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &mask, NULL);
    }

    // Extract the CLI args
    // This call will populate conf::ctx
    if (parse_cmd(argc, argv) != 0)
        return 1;

    if (conf::ctx.command == "version")
    {
        // Print the version
        std::cout << "hotcon " << version::HC_VERSION << std::endl;
        return 0;
    }

    if (conf::ctx.command == "new")
    {
        // This will create a new app console layout with the default config.
        return conf::create_app() == 0 ? 0 : 1;
    }

    const bool is_worker = conf::ctx.command == "worker";
    if (conf::init(is_worker) != 0)
        return 1;

    // Both the supervisor and the worker run from the application directory.
    if (chdir(conf::ctx.app_dir.c_str()) == -1)
    {
        std::cerr << errno << ": Could not change into " << conf::ctx.app_dir << "\n";
        conf::deinit();
        return 1;
    }

    return is_worker ? run_worker() : run_supervisor();
}
