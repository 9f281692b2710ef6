#ifndef _HC_UTIL_UTIL_
#define _HC_UTIL_UTIL_

#include "../pchheader.hpp"

/**
 * Contains helper functions and data structures used by multiple other subsystems.
 */

#define MIN(a, b) ((a < b) ? a : b)

namespace util
{
    uint64_t get_epoch_milliseconds();

    void sleep(const uint64_t milliseconds);

    const std::string realpath(const std::string &path);

    void mask_signal();

    void fork_detach();

    bool is_dir_exists(std::string_view path);

    bool is_file_exists(std::string_view path);

    int create_dir_tree_recursive(std::string_view path);

    std::list<std::string> fetch_dir_entries(std::string_view path);

    bool is_hidden_name(std::string_view name);

    int stoull(const std::string &str, uint64_t &result);

    const std::string get_name(std::string_view path);

    int read_from_fd(const int fd, std::string &buf, const off_t offset = 0);

    int write_to_fd(const int fd, std::string_view buf);

    int set_lock(const int fd, struct flock &lock, const bool is_rwlock, const off_t start, const off_t len);

    int release_lock(const int fd, struct flock &lock);

    int resolve_ipv4(std::string_view host, const uint16_t port, struct sockaddr_in &addr);

} // namespace util

#endif
