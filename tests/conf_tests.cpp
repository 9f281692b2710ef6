#include <catch2/catch.hpp>
#include "test_helpers.hpp"
#include "conf.hpp"

namespace
{
    // Loads the config file of the current app dir, applies the edit and writes it back.
    int edit_config(const std::function<void(jsoncons::ojson &)> &edit)
    {
        const int fd = open(conf::ctx.config_file.c_str(), O_RDONLY);
        if (fd == -1)
            return -1;

        std::string buf;
        const int res = util::read_from_fd(fd, buf);
        close(fd);
        if (res == -1)
            return -1;

        jsoncons::ojson d = jsoncons::ojson::parse(buf);
        edit(d);
        return conf::write_json_file(conf::ctx.config_file, d);
    }
} // namespace

TEST_CASE("Config defaults validate", "[conf]")
{
    conf::hc_config cfg;
    conf::populate_default_config(cfg, "shop");
    REQUIRE(conf::validate_config(cfg) == 0);
    REQUIRE(cfg.app.name == "shop");
    REQUIRE(cfg.app.workers == 1);

    SECTION("Worker count other than one is rejected")
    {
        cfg.app.workers = 2;
        REQUIRE(conf::validate_config(cfg) == -1);
        cfg.app.workers = 0;
        REQUIRE(conf::validate_config(cfg) == -1);
    }

    SECTION("Invalid log level is rejected")
    {
        cfg.log.log_level = "verbose";
        REQUIRE(conf::validate_config(cfg) == -1);
    }

    SECTION("Invalid logger is rejected")
    {
        cfg.log.loggers = {"console", "syslog"};
        REQUIRE(conf::validate_config(cfg) == -1);
    }

    SECTION("Missing socket path is rejected")
    {
        cfg.tunnel.socket_path.clear();
        REQUIRE(conf::validate_config(cfg) == -1);
    }
}

TEST_CASE("Debug endpoint resolution", "[conf]")
{
    conf::debug_config debug;

    SECTION("Port follows the debugger protocol unless set explicitly")
    {
        debug.protocol = conf::DEBUG_PROTOCOL::INSPECT;
        REQUIRE(conf::get_debug_port(debug) == 9229);

        debug.protocol = conf::DEBUG_PROTOCOL::LEGACY;
        REQUIRE(conf::get_debug_port(debug) == 5858);

        debug.port = 7000;
        REQUIRE(conf::get_debug_port(debug) == 7000);
    }

    SECTION("Host comes from the environment first")
    {
        unsetenv(conf::DEBUG_HOST_ENV);
        REQUIRE(conf::get_debug_host(debug) == "127.0.0.1");

        debug.host = "0.0.0.0";
        REQUIRE(conf::get_debug_host(debug) == "0.0.0.0");

        setenv(conf::DEBUG_HOST_ENV, "10.1.1.5", 1);
        REQUIRE(conf::get_debug_host(debug) == "10.1.1.5");

        setenv(conf::DEBUG_HOST_ENV, "", 1);
        REQUIRE(conf::get_debug_host(debug) == "0.0.0.0");

        unsetenv(conf::DEBUG_HOST_ENV);
    }
}

TEST_CASE("Log level names map to severities", "[conf]")
{
    REQUIRE(conf::get_loglevel_type("dbg") == conf::LOG_SEVERITY::DEBUG);
    REQUIRE(conf::get_loglevel_type("inf") == conf::LOG_SEVERITY::INFO);
    REQUIRE(conf::get_loglevel_type("wrn") == conf::LOG_SEVERITY::WARN);
    REQUIRE(conf::get_loglevel_type("err") == conf::LOG_SEVERITY::ERROR);
}

TEST_CASE("App config is created and loaded from the app directory", "[conf]")
{
    const std::string base = testutil::make_temp_dir();
    REQUIRE_FALSE(base.empty());
    const std::string app_dir = base + "/shop";

    conf::set_app_dir_paths("hotcon", app_dir);
    REQUIRE(conf::ctx.config_file == app_dir + "/cfg/hotcon.cfg");
    REQUIRE(conf::create_app() == 0);

    SECTION("Default config loads")
    {
        REQUIRE(conf::init(true) == 0);
        REQUIRE(conf::cfg.app.name == "shop");
        REQUIRE(conf::ctx.socket_path == app_dir + "/hotcon.sock");
        REQUIRE(conf::ctx.watch_paths == std::vector<std::string>{app_dir + "/lib", app_dir + "/cfg"});
        REQUIRE(conf::ctx.debug_port == 9229);
        REQUIRE(util::is_dir_exists(conf::ctx.log_dir));
        conf::deinit();
    }

    SECTION("Existing config is never overwritten")
    {
        REQUIRE(conf::create_app() == -1);
    }

    SECTION("Supervisor holds the config lock")
    {
        REQUIRE(conf::init(false) == 0);
        REQUIRE(conf::ctx.config_fd != -1);
        conf::deinit();
        REQUIRE(conf::ctx.config_fd == -1);
    }

    SECTION("Multi worker config is refused")
    {
        REQUIRE(edit_config([](jsoncons::ojson &d) { d["app"]["workers"] = 4; }) == 0);
        REQUIRE(conf::init(true) == -1);
    }

    SECTION("Missing section is refused")
    {
        REQUIRE(edit_config([](jsoncons::ojson &d) { d.erase("tunnel"); }) == 0);
        REQUIRE(conf::init(true) == -1);
    }

    SECTION("Relative and absolute paths resolve against the app dir")
    {
        REQUIRE(edit_config([](jsoncons::ojson &d) {
                    d["tunnel"]["socket_path"] = "/tmp/elsewhere.sock";
                    d["repl"]["history_file"] = "hist.json";
                    d["debug"]["protocol"] = "legacy";
                }) == 0);
        REQUIRE(conf::init(true) == 0);
        REQUIRE(conf::ctx.socket_path == "/tmp/elsewhere.sock");
        REQUIRE(conf::ctx.history_file == app_dir + "/hist.json");
        REQUIRE(conf::ctx.debug_port == 5858);
        conf::deinit();
    }

    testutil::remove_dir_tree(base);
}
