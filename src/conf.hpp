#ifndef _HC_CONF_
#define _HC_CONF_

#include "pchheader.hpp"
#include "util/util.hpp"

/**
 * Manages the central config and context structs.
 * Contains functions to config operations such as create/load.
 */
namespace conf
{
    constexpr uint16_t LEGACY_DEBUG_PORT = 5858;  // Debug proxy port for the legacy debugger protocol.
    constexpr uint16_t INSPECT_DEBUG_PORT = 9229; // Debug proxy port for the inspector protocol.
    constexpr uint16_t DEFAULT_WORKER_BASE_PORT = 2501;
    constexpr const char *DEFAULT_DEBUG_HOST = "127.0.0.1";
    constexpr const char *DEBUG_HOST_ENV = "DEBUG_HOST";
    constexpr const char *HISTORY_FILE_NAME = ".hotcon-history.json";

    // Debugger protocol flavour exposed by the worker. Decides the default proxy port.
    enum DEBUG_PROTOCOL
    {
        LEGACY,
        INSPECT
    };

    // Log severity levels used in hotcon.
    enum LOG_SEVERITY
    {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    struct app_config
    {
        std::string name;     // Application identity shown in the REPL prompt.
        uint16_t workers = 1; // No. of worker processes. Must be 1.
    };

    struct tunnel_config
    {
        std::string socket_path; // Unix socket path (relative to app dir unless absolute).
    };

    struct debug_config
    {
        DEBUG_PROTOCOL protocol = DEBUG_PROTOCOL::INSPECT;
        std::string host;                                   // Bind host for the proxy and the worker debug endpoint.
        uint16_t port = 0;                                  // Fixed proxy port. 0 means derive from the protocol.
        uint16_t worker_base_port = DEFAULT_WORKER_BASE_PORT; // First debug port handed to a worker.
    };

    struct watch_config
    {
        std::vector<std::string> paths; // Watched paths (relative to app dir unless absolute).
    };

    struct repl_config
    {
        std::string history_file;            // History file path. Empty means $HOME default.
        uint32_t history_size = 500;         // Max no. of history lines kept.
        uint32_t redraw_debounce_ms = 75;    // Prompt redraw debounce window.
        uint32_t connect_delay_ms = 1000;    // Delay between tunnel connect attempts.
        bool save_history_on_reload = false; // Also persist history when a reload is triggered.
    };

    struct log_config
    {
        std::string log_level;                   // Log severity level (dbg, inf, wrn, err)
        LOG_SEVERITY log_level_type;             // Log severity level enum (debug, info, warn, error)
        std::unordered_set<std::string> loggers; // List of enabled loggers (console, file)
        size_t max_mbytes_per_file = 0;          // Max MB size of a single log file.
        size_t max_file_count = 0;               // Max no. of log files to keep.
    };

    // Holds all the config values.
    struct hc_config
    {
        std::string hc_version;
        app_config app;
        tunnel_config tunnel;
        debug_config debug;
        watch_config watch;
        repl_config repl;
        log_config log;
    };

    // Holds contextual information about the console session.
    struct console_ctx
    {
        std::string command;  // The CLI command issued to launch hotcon.
        std::string exe_path; // hotcon executable full path (used to launch workers).

        std::string app_dir;       // Application base directory full path.
        std::string config_dir;    // Config dir full path.
        std::string config_file;   // Full path to the config file.
        std::string log_dir;       // Log dir full path.
        std::string socket_path;   // Resolved tunnel socket path.
        std::string history_file;  // Resolved history file path.
        std::string debug_host;    // Resolved debug bind host (env override applied).
        uint16_t debug_port = 0;   // Resolved debug proxy port.
        std::vector<std::string> watch_paths; // Resolved watched paths.

        int config_fd = -1;       // Config file file descriptor.
        struct flock config_lock; // Config file lock.
    };

    // Global console context struct exposed to the application.
    // Other modules will access context values via this.
    extern console_ctx ctx;

    // Global configuration struct exposed to the application.
    // Other modules will access config values via this.
    extern hc_config cfg;

    int init(const bool is_worker);

    void deinit();

    int create_app();

    void set_app_dir_paths(std::string exepath, std::string basedir);

    //------Internal-use functions for this namespace.

    void populate_default_config(hc_config &cfg, std::string_view app_name);

    int read_config(hc_config &cfg);

    int parse_config(hc_config &cfg, const jsoncons::ojson &d);

    int write_config(const hc_config &cfg);

    int validate_config(const hc_config &cfg);

    int validate_app_dir_paths();

    void resolve_runtime_paths(const hc_config &cfg);

    uint16_t get_debug_port(const debug_config &debug);

    const std::string get_debug_host(const debug_config &debug);

    LOG_SEVERITY get_loglevel_type(std::string_view severity);

    int set_config_lock();

    int release_config_lock();

    int write_json_file(const std::string &file_path, const jsoncons::ojson &d);

} // namespace conf

#endif
