#ifndef _HC_WORKER_INSPECTOR_
#define _HC_WORKER_INSPECTOR_

#include "../pchheader.hpp"
#include "../repl/evaluator.hpp"

namespace worker
{
    struct inspector_client
    {
        int fd = -1;
        std::string inbuf; // Bytes received but not yet terminated by a newline.
    };

    /**
     * Line based evaluation endpoint served on the worker debug port. Each received line is
     * evaluated and the output is written back. This is what the supervisor debug proxy forwards to.
     */
    class inspector
    {
    private:
        repl::evaluator &eval;
        int listen_fd = -1;
        uint16_t bound_port = 0;
        std::list<inspector_client> clients;
        std::atomic<bool> is_shutting_down = false;
        std::thread inspector_thread;

        void inspector_loop();
        int handle_client(inspector_client &client);

    public:
        explicit inspector(repl::evaluator &eval);
        ~inspector();
        int init(std::string_view host, const uint16_t port);
        void deinit();
        uint16_t listen_port() const;
    };

} // namespace worker

#endif
