#include <catch2/catch.hpp>
#include "msg/controlmsg_common.hpp"
#include "msg/controlmsg_parser.hpp"

TEST_CASE("Control messages are built as json", "[controlmsg]")
{
    std::string msg;

    SECTION("Reload")
    {
        msg::controlmsg::create_reload_message(msg);
        REQUIRE(msg == "{\"type\":\"reload\"}");
    }

    SECTION("Shutdown")
    {
        msg::controlmsg::create_shutdown_message(msg);
        REQUIRE(msg == "{\"type\":\"shutdown\"}");
    }

    SECTION("Resize")
    {
        msg::controlmsg::create_resize_message(msg, 24, 80);
        REQUIRE(msg == "{\"type\":\"resize\",\"rows\":24,\"cols\":80}");
    }
}

TEST_CASE("Control messages are parsed", "[controlmsg]")
{
    msg::controlmsg::controlmsg_parser parser;
    std::string type;

    SECTION("Type is extracted")
    {
        std::string msg;
        msg::controlmsg::create_reload_message(msg);
        REQUIRE(parser.parse(msg) == 0);
        REQUIRE(parser.extract_type(type) == 0);
        REQUIRE(type == msg::controlmsg::MSGTYPE_RELOAD);
    }

    SECTION("Resize geometry is extracted")
    {
        std::string msg;
        msg::controlmsg::create_resize_message(msg, 50, 132);
        REQUIRE(parser.parse(msg) == 0);
        REQUIRE(parser.extract_type(type) == 0);
        REQUIRE(type == msg::controlmsg::MSGTYPE_RESIZE);

        uint16_t rows = 0, cols = 0;
        REQUIRE(parser.extract_geometry(rows, cols) == 0);
        REQUIRE(rows == 50);
        REQUIRE(cols == 132);
    }

    SECTION("Resize without columns is rejected")
    {
        REQUIRE(parser.parse("{\"type\":\"resize\",\"rows\":10}") == 0);
        uint16_t rows = 0, cols = 0;
        REQUIRE(parser.extract_geometry(rows, cols) == -1);
    }

    SECTION("Invalid json is rejected")
    {
        REQUIRE(parser.parse("{\"type\":") == -1);
    }

    SECTION("Missing type is rejected")
    {
        REQUIRE(parser.parse("{\"kind\":\"reload\"}") == -1);
        REQUIRE(parser.parse("[\"reload\"]") == -1);
        REQUIRE(parser.parse("{\"type\":5}") == -1);
    }
}
