#ifndef _HC_UTIL_WRITER_
#define _HC_UTIL_WRITER_

#include "../pchheader.hpp"

namespace util
{
    /**
     * Byte sink abstraction. Diagnostic output flows through writers so it can be intercepted
     * and decorated without touching the process-wide stdio streams.
     */
    class writer
    {
    public:
        virtual ~writer()
        {
        }

        virtual int write(std::string_view data) = 0;
    };

    /**
     * Writer that writes straight into a file descriptor (eg. stderr).
     */
    class fd_writer : public writer
    {
    private:
        const int fd;

    public:
        explicit fd_writer(const int fd);
        int write(std::string_view data) override;
    };

} // namespace util

#endif
