#include "../pchheader.hpp"
#include "json/controlmsg_json.hpp"
#include "controlmsg_parser.hpp"

namespace jctlmsg = msg::controlmsg::json;

namespace msg::controlmsg
{
    int controlmsg_parser::parse(std::string_view message)
    {
        return jctlmsg::parse_control_message(jdoc, message);
    }

    int controlmsg_parser::extract_type(std::string &extracted_type) const
    {
        return jctlmsg::extract_type(extracted_type, jdoc);
    }

    int controlmsg_parser::extract_geometry(uint16_t &rows, uint16_t &cols) const
    {
        return jctlmsg::extract_geometry(rows, cols, jdoc);
    }

    void create_reload_message(std::string &msg)
    {
        jctlmsg::create_type_only_message(msg, MSGTYPE_RELOAD);
    }

    void create_shutdown_message(std::string &msg)
    {
        jctlmsg::create_type_only_message(msg, MSGTYPE_SHUTDOWN);
    }

    void create_resize_message(std::string &msg, const uint16_t rows, const uint16_t cols)
    {
        jctlmsg::create_resize_message(msg, rows, cols);
    }

} // namespace msg::controlmsg
