#ifndef _HC_HCLOG_
#define _HC_HCLOG_

#include "pchheader.hpp"
#include "util/writer.hpp"

namespace hclog
{
    /**
     * plog appender that hands formatted records to a util::writer instead of writing to
     * a stdio stream directly.
     */
    template <class Formatter>
    class writer_appender : public plog::IAppender
    {
    private:
        util::writer &out;

    public:
        explicit writer_appender(util::writer &out) : out(out)
        {
        }

        void write(const plog::Record &record) override
        {
            const plog::util::nstring str = Formatter::format(record);
            out.write(str);
        }
    };

    void init(const char *tag, const std::string &log_file_name, util::writer &console);

} // namespace hclog

#endif
