#include "../pchheader.hpp"
#include "../util/util.hpp"
#include "path_watcher.hpp"

namespace watch
{
    constexpr uint32_t WATCH_MASK = IN_CLOSE_WRITE | IN_MODIFY | IN_CREATE | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO | IN_DELETE_SELF;
    constexpr size_t EVENT_BUF_SIZE = 16 * 1024;

    path_watcher::~path_watcher()
    {
        deinit();
    }

    /**
     * Starts watching the given paths. Paths which do not exist are skipped with a warning.
     * @return 0 on success. -1 if the inotify instance could not be created.
     */
    int path_watcher::init(const std::vector<std::string> &paths)
    {
        inotify_fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
        if (inotify_fd == -1)
        {
            LOG_ERROR << errno << ": Error initializing inotify.";
            return -1;
        }

        for (const std::string &path : paths)
        {
            if (!util::is_dir_exists(path) && !util::is_file_exists(path))
            {
                LOG_WARNING << "Watch path " << path << " does not exist. Skipping.";
                continue;
            }

            if (add_watch_recursive(path) == -1)
            {
                deinit();
                return -1;
            }
        }

        LOG_DEBUG << "Watching " << watched.size() << " paths for changes.";
        return 0;
    }

    void path_watcher::deinit()
    {
        if (inotify_fd != -1)
        {
            close(inotify_fd);
            inotify_fd = -1;
        }
        watched.clear();
        pending.clear();
    }

    size_t path_watcher::watch_count() const
    {
        return watched.size();
    }

    int path_watcher::add_watch(const std::string &path)
    {
        const int wd = inotify_add_watch(inotify_fd, path.c_str(), WATCH_MASK);
        if (wd == -1)
        {
            LOG_ERROR << errno << ": Error adding watch for " << path;
            return -1;
        }
        watched[wd] = path;
        return 0;
    }

    int path_watcher::add_watch_recursive(const std::string &path)
    {
        if (add_watch(path) == -1)
            return -1;

        if (!util::is_dir_exists(path))
            return 0;

        for (const std::string &name : util::fetch_dir_entries(path))
        {
            if (util::is_hidden_name(name))
                continue;

            const std::string child = path + "/" + name;
            if (util::is_dir_exists(child) && add_watch_recursive(child) == -1)
                return -1;
        }
        return 0;
    }

    /**
     * Reads all the available inotify events into the pending list.
     * @return 0 on success. -1 on error.
     */
    int path_watcher::read_events()
    {
        alignas(struct inotify_event) char buf[EVENT_BUF_SIZE];

        while (true)
        {
            const ssize_t len = read(inotify_fd, buf, sizeof(buf));
            if (len == -1)
            {
                if (errno == EAGAIN || errno == EINTR)
                    return 0;

                LOG_ERROR << errno << ": Error reading inotify events.";
                return -1;
            }

            for (char *ptr = buf; ptr < buf + len;)
            {
                const struct inotify_event *ev = (const struct inotify_event *)ptr;
                ptr += sizeof(struct inotify_event) + ev->len;

                if (ev->mask & IN_IGNORED)
                {
                    watched.erase(ev->wd);
                    continue;
                }

                const auto itr = watched.find(ev->wd);
                if (itr == watched.end())
                    continue;

                if (ev->len > 0 && util::is_hidden_name(ev->name))
                    continue;

                const std::string path = ev->len > 0 ? (itr->second + "/" + ev->name) : itr->second;

                // Start watching newly created sub directories.
                if ((ev->mask & IN_ISDIR) && (ev->mask & (IN_CREATE | IN_MOVED_TO)) && add_watch_recursive(path) == -1)
                    LOG_WARNING << "Could not watch new directory " << path;

                watch_event event;
                event.kind = (ev->mask & (IN_DELETE | IN_MOVED_FROM | IN_DELETE_SELF)) ? WATCH_EVENT_KIND::REMOVE : WATCH_EVENT_KIND::UPDATE;
                event.path = path;
                pending.push_back(std::move(event));
            }
        }
    }

    /**
     * Blocks until a change event is available or the cancel fd becomes readable.
     * @param cancel_fd Fd which cancels the wait when readable. -1 if not cancellable.
     * @param event The populated change event.
     * @param timeout_ms Max wait time. -1 waits forever.
     * @return 1 when an event was populated. 0 on cancellation or timeout. -1 on error.
     */
    int path_watcher::wait_event(const int cancel_fd, watch_event &event, const int timeout_ms)
    {
        if (inotify_fd == -1)
            return -1;

        const uint64_t start = util::get_epoch_milliseconds();

        while (pending.empty())
        {
            int wait_ms = -1;
            if (timeout_ms >= 0)
            {
                const uint64_t elapsed = util::get_epoch_milliseconds() - start;
                if (elapsed >= (uint64_t)timeout_ms)
                    return 0;
                wait_ms = timeout_ms - elapsed;
            }

            struct pollfd pfds[2] = {{inotify_fd, POLLIN, 0}, {cancel_fd, POLLIN, 0}};
            const int res = poll(pfds, cancel_fd == -1 ? 1 : 2, wait_ms);
            if (res == -1)
            {
                if (errno == EINTR)
                    continue;
                LOG_ERROR << errno << ": Error polling inotify fd.";
                return -1;
            }

            if (cancel_fd != -1 && (pfds[1].revents & POLLIN))
                return 0;

            if ((pfds[0].revents & POLLIN) && read_events() == -1)
                return -1;
        }

        event = std::move(pending.front());
        pending.pop_front();
        return 1;
    }

} // namespace watch
