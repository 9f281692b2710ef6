#ifndef _HC_MSG_CONTROLMSG_PARSER_
#define _HC_MSG_CONTROLMSG_PARSER_

#include "../pchheader.hpp"

namespace msg::controlmsg
{
    class controlmsg_parser
    {
        jsoncons::json jdoc;

    public:
        int parse(std::string_view message);
        int extract_type(std::string &extracted_type) const;
        int extract_geometry(uint16_t &rows, uint16_t &cols) const;
    };

    void create_reload_message(std::string &msg);

    void create_shutdown_message(std::string &msg);

    void create_resize_message(std::string &msg, const uint16_t rows, const uint16_t cols);

} // namespace msg::controlmsg

#endif
