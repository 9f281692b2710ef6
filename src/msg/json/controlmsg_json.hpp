#ifndef _HC_MSG_JSON_CONTROLMSG_JSON_
#define _HC_MSG_JSON_CONTROLMSG_JSON_

#include "../../pchheader.hpp"

/**
 * Parser helpers for supervisor/worker control messages.
 */
namespace msg::controlmsg::json
{
    int parse_control_message(jsoncons::json &d, std::string_view message);

    int extract_type(std::string &extracted_type, const jsoncons::json &d);

    int extract_geometry(uint16_t &rows, uint16_t &cols, const jsoncons::json &d);

    void create_type_only_message(std::string &msg, std::string_view type);

    void create_resize_message(std::string &msg, const uint16_t rows, const uint16_t cols);

} // namespace msg::controlmsg::json

#endif
