#include "pchheader.hpp"
#include "conf.hpp"
#include "util/util.hpp"
#include "util/version.hpp"

namespace conf
{

    // Global console context struct exposed to the application.
    console_ctx ctx;

    // Global configuration struct exposed to the application.
    hc_config cfg;

    constexpr int FILE_PERMS = 0644;

    constexpr const char *PROTOCOL_LEGACY = "legacy";
    constexpr const char *PROTOCOL_INSPECT = "inspect";
    constexpr const char *CONFIG_FILE_NAME = "hotcon.cfg";

    bool init_success = false;
    bool is_locked = false;

    /**
     * Loads and initializes the config for execution. Must be called once during application startup.
     * @param is_worker Whether we are loading the config inside a worker process. Workers read the config
     *                  without taking the supervisor's config lock.
     * @return 0 for success. -1 for failure.
     */
    int init(const bool is_worker)
    {
        // The validations/loading needs to be in this order.
        // 1. Validate app directories
        // 2. Lock the config (supervisor only)
        // 3. Read and load the config into memory
        // 4. Validate the loaded config values

        if (validate_app_dir_paths() == -1)
            return -1;

        if (is_worker)
        {
            ctx.config_fd = open(ctx.config_file.data(), O_RDONLY | O_CLOEXEC);
            if (ctx.config_fd == -1)
            {
                std::cerr << errno << ": Error opening config file " << ctx.config_file << "\n";
                return -1;
            }
        }
        else if (set_config_lock() == -1)
        {
            return -1;
        }

        if (read_config(cfg) == -1 || validate_config(cfg) == -1)
        {
            deinit();
            return -1;
        }

        resolve_runtime_paths(cfg);

        init_success = true;
        return 0;
    }

    /**
     * Cleanup any resources.
     */
    void deinit()
    {
        if (is_locked)
        {
            // Releases the config file lock at the termination.
            release_config_lock();
        }
        else if (ctx.config_fd != -1)
        {
            close(ctx.config_fd);
            ctx.config_fd = -1;
        }
    }

    /**
     * Creates a new app console directory layout with the default config.
     * By the time this gets called, the 'ctx' struct must be populated.
     */
    int create_app()
    {
        if (util::is_file_exists(ctx.config_file))
        {
            std::cerr << "Config file already exists at " << ctx.config_file << ". Cannot overwrite.\n";
            return -1;
        }

        if (util::create_dir_tree_recursive(ctx.config_dir) == -1 ||
            util::create_dir_tree_recursive(ctx.log_dir) == -1)
        {
            std::cerr << "ERROR: unable to create directories.\n";
            return -1;
        }

        // We populate the in-memory struct with default settings and then save it to the file.
        hc_config cfg = {};
        populate_default_config(cfg, util::get_name(ctx.app_dir));

        if (write_config(cfg) != 0)
            return -1;

        std::cout << "Console config created at " << ctx.config_file << std::endl;
        return 0;
    }

    /**
     * Updates the context with directory paths based on provided base directory.
     * This is called after parsing the command line arg in order to populate the ctx.
     */
    void set_app_dir_paths(std::string exepath, std::string basedir)
    {
        if (exepath.empty())
        {
            // this code branch will never execute the way main is currently coded, but it might change in future
            std::cerr << "Executable path must be specified\n";
            exit(1);
        }

        if (basedir.empty())
        {
            // this code branch will never execute the way main is currently coded, but it might change in future
            std::cerr << "An application directory must be specified\n";
            exit(1);
        }

        // resolving the path through realpath will remove any trailing slash if present.
        // For 'new' the directory may not exist yet, so we fall back to the given path.
        const std::string resolved_dir = util::realpath(basedir);
        if (!resolved_dir.empty())
            basedir = resolved_dir;

        // /proc/self/exe gives the exact binary even when launched via PATH lookup.
        const std::string self_exe = util::realpath("/proc/self/exe");
        ctx.exe_path = self_exe.empty() ? util::realpath(exepath) : self_exe;

        ctx.app_dir = basedir;
        ctx.config_dir = basedir + "/cfg";
        ctx.config_file = ctx.config_dir + "/" + CONFIG_FILE_NAME;
        ctx.log_dir = basedir + "/log";
    }

    /**
     * Populates the given config struct with default values.
     */
    void populate_default_config(hc_config &cfg, std::string_view app_name)
    {
        cfg.hc_version = version::HC_VERSION;

        cfg.app.name = app_name;
        cfg.app.workers = 1;

        cfg.tunnel.socket_path = "hotcon.sock";

        cfg.debug.protocol = DEBUG_PROTOCOL::INSPECT;
        cfg.debug.host = DEFAULT_DEBUG_HOST;
        cfg.debug.port = 0;
        cfg.debug.worker_base_port = DEFAULT_WORKER_BASE_PORT;

        cfg.watch.paths = {"lib", "cfg"};

        cfg.repl.history_file = "";
        cfg.repl.history_size = 500;
        cfg.repl.redraw_debounce_ms = 75;
        cfg.repl.connect_delay_ms = 1000;
        cfg.repl.save_history_on_reload = false;

        cfg.log.log_level = "inf";
        cfg.log.log_level_type = LOG_SEVERITY::INFO;
        cfg.log.loggers = {"console", "file"};
        cfg.log.max_mbytes_per_file = 5;
        cfg.log.max_file_count = 10;
    }

    /**
     * Reads the config file on disk and populates the in-memory 'cfg' struct.
     * @return 0 for successful loading of config. -1 for failure.
     */
    int read_config(hc_config &cfg)
    {
        // Read the config file into json document object.
        std::string buf;
        if (util::read_from_fd(ctx.config_fd, buf) == -1)
        {
            std::cerr << "Error reading from the config file. " << errno << '\n';
            return -1;
        }

        jsoncons::ojson d;
        try
        {
            d = jsoncons::ojson::parse(buf, jsoncons::strict_json_parsing());
        }
        catch (const std::exception &e)
        {
            std::cerr << "Invalid config file format. " << e.what() << '\n';
            return -1;
        }
        buf.clear();

        return parse_config(cfg, d);
    }

    /**
     * Populates the config struct from a parsed config json document.
     * @return 0 on success. -1 when a required field is missing or has an invalid value.
     */
    int parse_config(hc_config &cfg, const jsoncons::ojson &d)
    {
        try
        {
            // Check whether the hc version is specified.
            cfg.hc_version = d["hc_version"].as<std::string>();
            if (cfg.hc_version.empty())
            {
                std::cerr << "Config hotcon version missing.\n";
                return -1;
            }

            // Check whether this config complies with the min version requirement.
            const int verresult = version::version_compare(cfg.hc_version, std::string(version::MIN_CONFIG_VERSION));
            if (verresult == -1)
            {
                std::cerr << "Config version too old. Minimum "
                          << version::MIN_CONFIG_VERSION << " required. "
                          << cfg.hc_version << " found.\n";
                return -1;
            }
            else if (verresult == -2)
            {
                std::cerr << "Malformed version string.\n";
                return -1;
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "Required config field hc_version missing at " << ctx.config_file << std::endl;
            return -1;
        }

        std::string jpath;
        try
        {
            // app
            jpath = "app";
            const jsoncons::ojson &app = d["app"];
            cfg.app.name = app["name"].as<std::string>();
            cfg.app.workers = app["workers"].as<uint16_t>();

            // tunnel
            jpath = "tunnel";
            cfg.tunnel.socket_path = d["tunnel"]["socket_path"].as<std::string>();

            // debug
            jpath = "debug";
            const jsoncons::ojson &debug = d["debug"];
            const std::string protocol = debug["protocol"].as<std::string>();
            if (protocol == PROTOCOL_LEGACY)
                cfg.debug.protocol = DEBUG_PROTOCOL::LEGACY;
            else if (protocol == PROTOCOL_INSPECT)
                cfg.debug.protocol = DEBUG_PROTOCOL::INSPECT;
            else
            {
                std::cerr << "Invalid debug protocol. 'inspect' or 'legacy' expected.\n";
                return -1;
            }
            cfg.debug.host = debug["host"].as<std::string>();
            cfg.debug.port = debug["port"].as<uint16_t>();
            cfg.debug.worker_base_port = debug["worker_base_port"].as<uint16_t>();

            // watch
            jpath = "watch";
            cfg.watch.paths.clear();
            for (auto &path : d["watch"]["paths"].array_range())
                cfg.watch.paths.push_back(path.as<std::string>());

            // repl
            jpath = "repl";
            const jsoncons::ojson &repl = d["repl"];
            cfg.repl.history_file = repl["history_file"].as<std::string>();
            cfg.repl.history_size = repl["history_size"].as<uint32_t>();
            cfg.repl.redraw_debounce_ms = repl["redraw_debounce_ms"].as<uint32_t>();
            cfg.repl.connect_delay_ms = repl["connect_delay_ms"].as<uint32_t>();
            cfg.repl.save_history_on_reload = repl["save_history_on_reload"].as<bool>();

            // log
            jpath = "log";
            const jsoncons::ojson &log = d["log"];
            cfg.log.log_level = log["log_level"].as<std::string>();
            cfg.log.log_level_type = get_loglevel_type(cfg.log.log_level);
            cfg.log.loggers.clear();
            for (auto &v : log["loggers"].array_range())
                cfg.log.loggers.emplace(v.as<std::string>());
            cfg.log.max_mbytes_per_file = log["max_mbytes_per_file"].as<size_t>();
            cfg.log.max_file_count = log["max_file_count"].as<size_t>();
        }
        catch (const std::exception &e)
        {
            std::cerr << "Required " << jpath << " config field missing or invalid at " << ctx.config_file << ". " << e.what() << std::endl;
            return -1;
        }

        return 0;
    }

    /**
     * Saves the provided 'cfg' struct into the config file.
     * @return 0 for successful save. -1 for failure.
     */
    int write_config(const hc_config &cfg)
    {
        // Popualte json document with 'cfg' values.
        // ojson is used instead of json to preserve insertion order.
        jsoncons::ojson d;
        d.insert_or_assign("hc_version", cfg.hc_version);

        {
            jsoncons::ojson app;
            app.insert_or_assign("name", cfg.app.name);
            app.insert_or_assign("workers", cfg.app.workers);
            d.insert_or_assign("app", app);
        }

        {
            jsoncons::ojson tunnel;
            tunnel.insert_or_assign("socket_path", cfg.tunnel.socket_path);
            d.insert_or_assign("tunnel", tunnel);
        }

        {
            jsoncons::ojson debug;
            debug.insert_or_assign("protocol", cfg.debug.protocol == DEBUG_PROTOCOL::LEGACY ? PROTOCOL_LEGACY : PROTOCOL_INSPECT);
            debug.insert_or_assign("host", cfg.debug.host);
            debug.insert_or_assign("port", cfg.debug.port);
            debug.insert_or_assign("worker_base_port", cfg.debug.worker_base_port);
            d.insert_or_assign("debug", debug);
        }

        {
            jsoncons::ojson watch;
            jsoncons::ojson paths(jsoncons::json_array_arg);
            for (const std::string &path : cfg.watch.paths)
                paths.push_back(path);
            watch.insert_or_assign("paths", paths);
            d.insert_or_assign("watch", watch);
        }

        {
            jsoncons::ojson repl;
            repl.insert_or_assign("history_file", cfg.repl.history_file);
            repl.insert_or_assign("history_size", cfg.repl.history_size);
            repl.insert_or_assign("redraw_debounce_ms", cfg.repl.redraw_debounce_ms);
            repl.insert_or_assign("connect_delay_ms", cfg.repl.connect_delay_ms);
            repl.insert_or_assign("save_history_on_reload", cfg.repl.save_history_on_reload);
            d.insert_or_assign("repl", repl);
        }

        {
            jsoncons::ojson log;
            log.insert_or_assign("log_level", cfg.log.log_level);
            jsoncons::ojson loggers(jsoncons::json_array_arg);
            for (const std::string &logger : cfg.log.loggers)
                loggers.push_back(logger);
            log.insert_or_assign("loggers", loggers);
            log.insert_or_assign("max_mbytes_per_file", cfg.log.max_mbytes_per_file);
            log.insert_or_assign("max_file_count", cfg.log.max_file_count);
            d.insert_or_assign("log", log);
        }

        return write_json_file(ctx.config_file, d);
    }

    /**
     * Validates the 'cfg' struct for invalid values.
     * @return 0 for successful validation. -1 for failure.
     */
    int validate_config(const hc_config &cfg)
    {
        // The console attaches to exactly one worker. Any other worker count cannot be supported.
        if (cfg.app.workers != 1)
        {
            std::cerr << "\n"
                      << "hotcon requires your application to be configured with\n"
                      << "\"app.workers\" set to 1. Please change " << ctx.config_file << " and try again.\n"
                      << "\n";
            return -1;
        }

        bool fields_missing = false;

        fields_missing |= cfg.app.name.empty() && std::cerr << "Missing cfg field: app name\n";
        fields_missing |= cfg.tunnel.socket_path.empty() && std::cerr << "Missing cfg field: tunnel socket_path\n";
        fields_missing |= cfg.debug.worker_base_port == 0 && std::cerr << "Missing cfg field: debug worker_base_port\n";
        fields_missing |= cfg.repl.history_size == 0 && std::cerr << "Missing cfg field: repl history_size\n";
        fields_missing |= cfg.log.log_level.empty() && std::cerr << "Missing cfg field: log_level\n";

        if (fields_missing)
        {
            std::cerr << "Required configuration fields missing at " << ctx.config_file << std::endl;
            return -1;
        }

        // Log settings
        const std::unordered_set<std::string> valid_loglevels({"dbg", "inf", "wrn", "err"});
        if (valid_loglevels.count(cfg.log.log_level) != 1)
        {
            std::cerr << "Invalid loglevel configured. Valid values: dbg|inf|wrn|err\n";
            return -1;
        }

        const std::unordered_set<std::string> valid_loggers({"console", "file"});
        for (const std::string &logger : cfg.log.loggers)
        {
            if (valid_loggers.count(logger) != 1)
            {
                std::cerr << "Invalid logger. Valid values: console|file\n";
                return -1;
            }
        }

        return 0;
    }

    /**
     * Checks for the existence of the app directory and the config file.
     * @return 0 for successful validation. -1 for failure.
     */
    int validate_app_dir_paths()
    {
        if (!util::is_dir_exists(ctx.app_dir))
        {
            std::cerr << ctx.app_dir << " does not exist.\n";
            return -1;
        }

        if (!util::is_file_exists(ctx.config_file))
        {
            std::cerr << ctx.config_file << " does not exist. Run 'hotcon new " << ctx.app_dir << "' to create a default config.\n";
            return -1;
        }

        if (!util::is_dir_exists(ctx.log_dir) && util::create_dir_tree_recursive(ctx.log_dir) == -1)
        {
            std::cerr << "Unable to create log dir " << ctx.log_dir << "\n";
            return -1;
        }

        return 0;
    }

    /**
     * Resolves config values that depend on the app dir or the environment into the context.
     */
    void resolve_runtime_paths(const hc_config &cfg)
    {
        const auto resolve = [](const std::string &path) {
            return (!path.empty() && path[0] == '/') ? path : (ctx.app_dir + "/" + path);
        };

        ctx.socket_path = resolve(cfg.tunnel.socket_path);

        if (!cfg.repl.history_file.empty())
        {
            ctx.history_file = resolve(cfg.repl.history_file);
        }
        else
        {
            const char *home = getenv("HOME");
            ctx.history_file = std::string(home ? home : ctx.app_dir.c_str()) + "/" + HISTORY_FILE_NAME;
        }

        ctx.watch_paths.clear();
        for (const std::string &path : cfg.watch.paths)
            ctx.watch_paths.push_back(resolve(path));

        ctx.debug_host = get_debug_host(cfg.debug);
        ctx.debug_port = get_debug_port(cfg.debug);
    }

    /**
     * Returns the fixed debug proxy port. An explicitly configured port wins, otherwise the
     * port is decided by the debugger protocol flavour.
     */
    uint16_t get_debug_port(const debug_config &debug)
    {
        if (debug.port > 0)
            return debug.port;

        return debug.protocol == DEBUG_PROTOCOL::LEGACY ? LEGACY_DEBUG_PORT : INSPECT_DEBUG_PORT;
    }

    // DEBUG_HOST environment variable overrides the configured host.
    const std::string get_debug_host(const debug_config &debug)
    {
        const char *env_host = getenv(DEBUG_HOST_ENV);
        if (env_host && strlen(env_host) > 0)
            return env_host;

        return debug.host.empty() ? DEFAULT_DEBUG_HOST : debug.host;
    }

    LOG_SEVERITY get_loglevel_type(std::string_view severity)
    {
        if (severity == "dbg")
            return LOG_SEVERITY::DEBUG;
        else if (severity == "wrn")
            return LOG_SEVERITY::WARN;
        else if (severity == "inf")
            return LOG_SEVERITY::INFO;
        else
            return LOG_SEVERITY::ERROR;
    }

    /**
     * Locks the config file. If already locked means there's another supervisor already running in the same directory.
     * If so, log error and return, Otherwise lock the config.
     * @return Returns 0 if lock is successfully aquired, -1 on error.
     */
    int set_config_lock()
    {
        ctx.config_fd = open(ctx.config_file.data(), O_RDWR | O_CLOEXEC, 444);
        if (ctx.config_fd == -1)
        {
            std::cerr << errno << ": Error opening config file " << ctx.config_file << "\n";
            return -1;
        }

        if (util::set_lock(ctx.config_fd, ctx.config_lock, true, 0, 0) == -1)
        {
            if (errno == EACCES || errno == EAGAIN)
            {
                std::cerr << "Another hotcon instance is already running in directory " << ctx.app_dir << "\n";
            }
            // Close fd if lock aquiring failed.
            close(ctx.config_fd);
            ctx.config_fd = -1;
            return -1;
        }

        is_locked = true;
        return 0;
    }

    /**
     * Releases the config file lock.
     * @return Returns 0 if lock is successfully released, -1 on error.
     */
    int release_config_lock()
    {
        const int res = util::release_lock(ctx.config_fd, ctx.config_lock);
        // Close fd in termination.
        close(ctx.config_fd);
        ctx.config_fd = -1;
        is_locked = false;
        return res;
    }

    /**
     * Writes the given json doc to a file.
     * @param file_path Path to the file.
     * @param d A valid json document.
     * @return 0 on success. -1 on failure.
     */
    int write_json_file(const std::string &file_path, const jsoncons::ojson &d)
    {
        std::string json;
        // Convert json object to a string.
        try
        {
            jsoncons::json_options options;
            options.object_array_line_splits(jsoncons::line_split_kind::multi_line);
            options.spaces_around_comma(jsoncons::spaces_option::no_spaces);
            std::ostringstream os;
            os << jsoncons::pretty_print(d, options);
            json = os.str();
            os.clear();
        }
        catch (const std::exception &e)
        {
            std::cerr << "Converting json to string failed. " << file_path << std::endl;
            return -1;
        }

        // O_TRUNC flag is used to trucate existing content from the file.
        const int fd = open(file_path.data(), O_CREAT | O_RDWR | O_TRUNC | O_CLOEXEC, FILE_PERMS);
        if (fd == -1 || util::write_to_fd(fd, json) == -1)
        {
            std::cerr << "Writing file failed. " << file_path << std::endl;
            if (fd != -1)
                close(fd);
            return -1;
        }
        close(fd);
        return 0;
    }

} // namespace conf
