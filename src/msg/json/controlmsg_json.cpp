#include "../../pchheader.hpp"
#include "../controlmsg_common.hpp"
#include "controlmsg_json.hpp"

namespace msg::controlmsg::json
{
    // JSON separators
    constexpr const char *SEP_COLON = "\":\"";
    constexpr const char *SEP_COMMA_NOQUOTE = ",\"";
    constexpr const char *SEP_COLON_NOQUOTE = "\":";

    /**
     * Parses a json control message exchanged between the supervisor and the worker.
     * @param d Jsoncons document to which the parsed json should be loaded.
     * @param message The message to parse.
     *                Message format:
     *                {
     *                  'type': '<message type>'
     *                  ...
     *                }
     * @return 0 on successful parsing. -1 for failure.
     */
    int parse_control_message(jsoncons::json &d, std::string_view message)
    {
        try
        {
            d = jsoncons::json::parse(message, jsoncons::strict_json_parsing());
        }
        catch (const std::exception &e)
        {
            LOG_ERROR << "Control json message parsing failed. " << e.what();
            return -1;
        }

        // Check existence of msg type field.
        if (!d.is_object() || !d.contains(msg::controlmsg::FLD_TYPE) || !d[msg::controlmsg::FLD_TYPE].is<std::string>())
        {
            LOG_ERROR << "Control json message 'type' missing or invalid.";
            return -1;
        }

        return 0;
    }

    /**
     * Extracts the message 'type' value from the json document.
     */
    int extract_type(std::string &extracted_type, const jsoncons::json &d)
    {
        extracted_type = d[msg::controlmsg::FLD_TYPE].as<std::string>();
        return 0;
    }

    /**
     * Extracts the terminal geometry from a resize message.
     * Message format:
     * {
     *   'type': 'resize',
     *   'rows': <terminal rows>,
     *   'cols': <terminal columns>
     * }
     * @return 0 on success. -1 when the fields are missing or invalid.
     */
    int extract_geometry(uint16_t &rows, uint16_t &cols, const jsoncons::json &d)
    {
        if (!d.contains(msg::controlmsg::FLD_ROWS) || !d[msg::controlmsg::FLD_ROWS].is<uint16_t>() ||
            !d.contains(msg::controlmsg::FLD_COLS) || !d[msg::controlmsg::FLD_COLS].is<uint16_t>())
        {
            LOG_ERROR << "Resize message geometry missing or invalid.";
            return -1;
        }

        rows = d[msg::controlmsg::FLD_ROWS].as<uint16_t>();
        cols = d[msg::controlmsg::FLD_COLS].as<uint16_t>();
        return 0;
    }

    /**
     * Constructs a control message which only carries the message type.
     * Message format:
     * {
     *   'type': '<type>'
     * }
     */
    void create_type_only_message(std::string &msg, std::string_view type)
    {
        msg.reserve(32);
        msg.append("{\"")
            .append(msg::controlmsg::FLD_TYPE)
            .append(SEP_COLON)
            .append(type)
            .append("\"}");
    }

    /**
     * Constructs a terminal resize message.
     * Message format:
     * {
     *   'type': 'resize',
     *   'rows': <terminal rows>,
     *   'cols': <terminal columns>
     * }
     */
    void create_resize_message(std::string &msg, const uint16_t rows, const uint16_t cols)
    {
        msg.reserve(64);
        msg.append("{\"")
            .append(msg::controlmsg::FLD_TYPE)
            .append(SEP_COLON)
            .append(msg::controlmsg::MSGTYPE_RESIZE)
            .append("\"")
            .append(SEP_COMMA_NOQUOTE)
            .append(msg::controlmsg::FLD_ROWS)
            .append(SEP_COLON_NOQUOTE)
            .append(std::to_string(rows))
            .append(SEP_COMMA_NOQUOTE)
            .append(msg::controlmsg::FLD_COLS)
            .append(SEP_COLON_NOQUOTE)
            .append(std::to_string(cols))
            .append("}");
    }

} // namespace msg::controlmsg::json
