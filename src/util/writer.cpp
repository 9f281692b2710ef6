#include "writer.hpp"
#include "util.hpp"

namespace util
{
    fd_writer::fd_writer(const int fd) : fd(fd)
    {
    }

    /**
     * @return 0 when all bytes were written. -1 on error.
     */
    int fd_writer::write(std::string_view data)
    {
        return write_to_fd(fd, data);
    }

} // namespace util
