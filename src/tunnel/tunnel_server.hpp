#ifndef _HC_TUNNEL_TUNNEL_SERVER_
#define _HC_TUNNEL_TUNNEL_SERVER_

#include "../pchheader.hpp"

namespace tunnel
{
    enum SESSION_STATE
    {
        OPEN,
        CLOSING
    };

    // One accepted worker connection.
    struct session
    {
        int fd = -1;
        uint16_t rows = 0;
        uint16_t cols = 0;
        SESSION_STATE state = SESSION_STATE::OPEN;
    };

    enum TUNNEL_EVENT_TYPE
    {
        CONNECTED,    // A worker connected. Carries the terminal geometry.
        RESIZE,       // Operator terminal was resized. Carries the new geometry.
        DISCONNECTED, // The worker connection ended.
        FATAL         // The tunnel cannot continue (eg. raw mode failure or terminal hangup).
    };

    struct tunnel_event
    {
        TUNNEL_EVENT_TYPE type = TUNNEL_EVENT_TYPE::CONNECTED;
        uint16_t rows = 0;
        uint16_t cols = 0;
    };

    void handle_winch(int signum);

    /**
     * Unix socket listener which relays raw bytes between the operator terminal and the
     * single connected worker. Further connects wait in the listen backlog until the current
     * session ends.
     */
    class tunnel_server
    {
    private:
        std::string socket_path;
        int listen_fd = -1;
        int in_fd = -1;
        int out_fd = -1;
        int wake_fds[2] = {-1, -1}; // Self-pipe for resize notifications and shutdown.

        std::optional<session> current;
        struct termios saved_mode;
        bool is_raw = false;

        std::atomic<bool> idle = true;
        std::atomic<bool> is_shutting_down = false;
        std::thread relay_thread;
        moodycamel::ReaderWriterQueue<tunnel_event> events;

        void relay_loop();
        int accept_session();
        void close_session();
        int relay(const int from_fd, const int to_fd, const bool from_session);
        void push_event(const TUNNEL_EVENT_TYPE type);

    public:
        tunnel_server();
        ~tunnel_server();
        int init(std::string_view socket_path, const int in_fd, const int out_fd);
        void deinit();
        bool is_idle() const;
        bool try_dequeue_event(tunnel_event &event);
        void notify_resize();
    };

} // namespace tunnel

#endif
