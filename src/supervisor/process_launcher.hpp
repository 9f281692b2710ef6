#ifndef _HC_SUPERVISOR_PROCESS_LAUNCHER_
#define _HC_SUPERVISOR_PROCESS_LAUNCHER_

#include "../pchheader.hpp"

namespace supervisor
{
    enum class WORKER_STATE
    {
        STARTING,
        RUNNING,
        EXITING
    };

    struct worker_process
    {
        pid_t pid = 0;
        int control_fd = -1;       // Supervisor end of the control channel.
        uint16_t debug_port = 0;   // Debug port assigned to this worker.
        bool managed_exit = false; // Whether the supervisor requested the exit.
        WORKER_STATE state = WORKER_STATE::STARTING;
    };

    /**
     * Creates and destroys worker processes for the supervisor.
     */
    class process_launcher
    {
    public:
        virtual ~process_launcher()
        {
        }

        /**
         * Starts a worker for the debug port in 'worker'. Populates pid and control_fd.
         * @return 0 on success. -1 on failure.
         */
        virtual int spawn(worker_process &worker) = 0;

        /**
         * Stops the worker and reaps it. Closes the control fd.
         * @return 0 on success. -1 on failure.
         */
        virtual int terminate(worker_process &worker) = 0;

        /**
         * Checks whether the worker has exited. Reaps it if so.
         * @return 0 if still running. 1 if exited. -1 on error.
         */
        virtual int check_exited(worker_process &worker, const bool block) = 0;
    };

    /**
     * Launches workers by forking and executing the hotcon binary in worker mode.
     */
    class posix_launcher : public process_launcher
    {
    private:
        const std::string exe_path;
        const std::string app_dir;
        const uint32_t grace_period_ms;

    public:
        posix_launcher(std::string_view exe_path, std::string_view app_dir, const uint32_t grace_period_ms = 3000);
        int spawn(worker_process &worker) override;
        int terminate(worker_process &worker) override;
        int check_exited(worker_process &worker, const bool block) override;
    };

} // namespace supervisor

#endif
