#ifndef _HC_WATCH_PATH_WATCHER_
#define _HC_WATCH_PATH_WATCHER_

#include "../pchheader.hpp"

namespace watch
{
    enum WATCH_EVENT_KIND
    {
        UPDATE,
        REMOVE
    };

    struct watch_event
    {
        WATCH_EVENT_KIND kind = WATCH_EVENT_KIND::UPDATE;
        std::string path;
    };

    /**
     * Recursive inotify based watcher over a set of files and directories.
     * Dotfiles and dot-directories are ignored.
     */
    class path_watcher
    {
    private:
        int inotify_fd = -1;
        std::unordered_map<int, std::string> watched; // Watch descriptor -> watched path.
        std::list<watch_event> pending;               // Events read but not yet handed out.

        int add_watch(const std::string &path);
        int add_watch_recursive(const std::string &path);
        int read_events();

    public:
        ~path_watcher();
        int init(const std::vector<std::string> &paths);
        void deinit();
        int wait_event(const int cancel_fd, watch_event &event, const int timeout_ms = -1);
        size_t watch_count() const;
    };

} // namespace watch

#endif
