#include "../pchheader.hpp"
#include "util.hpp"

namespace util
{
    constexpr mode_t DIR_PERMS = 0755;

    /**
    * Returns current time in UNIX epoch milliseconds.
    */
    uint64_t get_epoch_milliseconds()
    {
        return std::chrono::duration_cast<std::chrono::duration<std::uint64_t, std::milli>>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    /**
     * Sleeps the current thread for specified no. of milliseconds.
     */
    void sleep(const uint64_t milliseconds)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
    }

    // Provide a safe std::string overload for realpath
    const std::string realpath(const std::string &path)
    {
        std::array<char, PATH_MAX + 1> buffer;
        if (!::realpath(path.c_str(), buffer.data()))
            return {};

        buffer[PATH_MAX] = '\0';
        return buffer.data();
    }

    // Applies signal mask to the calling thread.
    void mask_signal()
    {
        sigset_t mask;
        sigemptyset(&mask);
        sigaddset(&mask, SIGINT);
        sigaddset(&mask, SIGTERM);
        sigaddset(&mask, SIGPIPE);
        sigaddset(&mask, SIGWINCH);
        pthread_sigmask(SIG_BLOCK, &mask, NULL);
    }

    /**
     * Clears signal mask and signal handlers from the caller.
     * Called by worker processes forked from the supervisor so they get detatched from
     * the supervisor signal setup.
     */
    void fork_detach()
    {
        // Restore signal handlers to defaults.
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        signal(SIGSEGV, SIG_DFL);
        signal(SIGABRT, SIG_DFL);
        signal(SIGWINCH, SIG_DFL);

        // Remove any signal masks applied by the supervisor.
        sigset_t mask;
        sigemptyset(&mask);
        pthread_sigmask(SIG_SETMASK, &mask, NULL);

        // Set process group id (so the terminal doesn't send kill signals to forked children).
        setpgrp();
    }

    /**
     * Check whether given directory exists.
     * @param path Directory path.
     * @return Returns true if given directory exists otherwise false.
     */
    bool is_dir_exists(std::string_view path)
    {
        struct stat st;
        return (stat(path.data(), &st) == 0 && S_ISDIR(st.st_mode));
    }

    /**
     * Check whether given file exists.
     * @param path File path.
     * @return Returns true if give file exists otherwise false.
     */
    bool is_file_exists(std::string_view path)
    {
        struct stat st;
        return (stat(path.data(), &st) == 0 && S_ISREG(st.st_mode));
    }

    /**
     * Recursively creates directories and sub-directories if not exist.
     * @param path Directory path.
     * @return Returns 0 operations succeeded otherwise -1.
     */
    int create_dir_tree_recursive(std::string_view path)
    {
        if (strcmp(path.data(), "/") == 0 || strcmp(path.data(), ".") == 0) // No need of checking if we are at root.
            return 0;

        // Check whether this dir exists or not.
        struct stat st;
        if (stat(path.data(), &st) != 0 || !S_ISDIR(st.st_mode))
        {
            // Check and create parent dir tree first.
            char *path2 = strdup(path.data());
            char *parent_dir_path = dirname(path2);
            bool error_thrown = false;

            if (create_dir_tree_recursive(parent_dir_path) == -1)
                error_thrown = true;

            free(path2);

            // Create this dir.
            if (!error_thrown && mkdir(path.data(), DIR_PERMS) == -1)
            {
                LOG_ERROR << errno << ": Error in recursive dir creation. " << path;
                error_thrown = true;
            }

            if (error_thrown)
                return -1;
        }

        return 0;
    }

    /**
     * Fetch all the files and directiries inside the given directory.
     * @param path Directory path.
     * @return Returns the list of entries inside the directory.
     */
    std::list<std::string> fetch_dir_entries(std::string_view path)
    {
        std::list<std::string> entries;
        DIR *dr;

        // Open the directory stream.
        if ((dr = opendir(path.data())))
        {
            // Take next directory entry from the directory stream.
            struct dirent *en;
            while ((en = readdir(dr)))
            {
                // Push into the entries list if reading directory entry is not current directory entry
                // or previous directory entry.
                if (std::strcmp(en->d_name, ".") != 0 && std::strcmp(en->d_name, "..") != 0)
                {
                    entries.push_back(en->d_name);
                }
            }
            // Close directory stream.
            closedir(dr);
        }

        return entries;
    }

    // Dotfiles and dot-directories.
    bool is_hidden_name(std::string_view name)
    {
        return !name.empty() && name[0] == '.';
    }

    /**
     * Converts given string to a uint_64. A wrapper function for std::stoull.
     * @param str String variable.
     * @param result Variable to store the answer from the conversion.
     * @return Returns 0 in a successful conversion and -1 on error.
    */
    int stoull(const std::string &str, uint64_t &result)
    {
        try
        {
            result = std::stoull(str);
        }
        catch (const std::exception &e)
        {
            // Return -1 if any exceptions are captured.
            return -1;
        }
        return 0;
    }

    // Returns the file/dir name of the given path.
    const std::string get_name(std::string_view path)
    {
        char *path2 = strdup(path.data());
        const std::string name = basename(path2);
        free(path2);
        return name;
    }

    /**
     * Reads the entire file from given file discriptor.
     * @param fd File descriptor to be read.
     * @param buf String buffer to be populated.
     * @param offset Begin offset of the file to read.
     * @return Returns number of bytes read in a successful read and -1 on error.
    */
    int read_from_fd(const int fd, std::string &buf, const off_t offset)
    {
        struct stat st;
        if (fstat(fd, &st) == -1)
        {
            LOG_ERROR << errno << ": Error in stat for reading entire file.";
            return -1;
        }

        buf.resize(st.st_size - offset);

        return pread(fd, buf.data(), buf.size(), offset);
    }

    /**
     * Writes the whole buffer to the given fd, continuing after partial writes and interrupts.
     * @return 0 when all bytes were written. -1 on error.
     */
    int write_to_fd(const int fd, std::string_view buf)
    {
        size_t written = 0;
        while (written < buf.size())
        {
            const ssize_t res = write(fd, buf.data() + written, buf.size() - written);
            if (res == -1)
            {
                if (errno == EINTR)
                    continue;

                if (errno == EAGAIN)
                {
                    struct pollfd pfd = {fd, POLLOUT, 0};
                    poll(&pfd, 1, 100);
                    continue;
                }

                return -1;
            }
            written += res;
        }
        return 0;
    }

    /**
     * Create a record lock for the file descriptor. Lock is associated with the process (Not for forked child processes).
     * @param fd File descriptor to be locked.
     * @param lock File lock.
     * @param is_rwlock Whether the record lock is a write lock.
     * @param start Starting offset for the lock.
     * @param len Number of bytes to lock.
     * @return Returns 0 if lock is successfully acquired, -1 on error.
    */
    int set_lock(const int fd, struct flock &lock, const bool is_rwlock, const off_t start, const off_t len)
    {
        lock.l_type = is_rwlock ? F_WRLCK : F_RDLCK;
        lock.l_whence = SEEK_SET;
        lock.l_start = start,
        lock.l_len = len;
        return fcntl(fd, F_SETLK, &lock);
    }

    /**
     * Releases the lock on file descriptor.
     * @param fd File descriptor to be released.
     * @param lock File lock.
     * @return Returns 0 if lock is successfully released, -1 on error.
    */
    int release_lock(const int fd, struct flock &lock)
    {
        lock.l_type = F_UNLCK;
        return fcntl(fd, F_SETLKW, &lock);
    }

    /**
     * Resolves the given host into an IPv4 socket address.
     * @return 0 on success. -1 on failure.
     */
    int resolve_ipv4(std::string_view host, const uint16_t port, struct sockaddr_in &addr)
    {
        struct addrinfo hints;
        memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo *result = NULL;
        const std::string host_str(host);
        const int res = getaddrinfo(host_str.c_str(), NULL, &hints, &result);
        if (res != 0 || result == NULL)
        {
            LOG_ERROR << "Could not resolve host " << host << ". " << gai_strerror(res);
            return -1;
        }

        memcpy(&addr, result->ai_addr, sizeof(struct sockaddr_in));
        addr.sin_port = htons(port);
        freeaddrinfo(result);
        return 0;
    }

} // namespace util
