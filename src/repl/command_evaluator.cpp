#include "../pchheader.hpp"
#include "../util/util.hpp"
#include "evaluator.hpp"

namespace repl
{
    constexpr const char *HELP_TEXT =
        ".exit       Exit the console and stop the application\n"
        ".help       Show this help\n"
        ".history    Show the input history\n"
        ".reload     Restart the worker\n"
        "echo <text> Print text\n"
        "log <text>  Write a diagnostic log line\n"
        "pid         Show the worker process id\n"
        "port        Show the worker debug port\n"
        "uptime      Show the worker uptime\n";

    command_evaluator::command_evaluator(const history &hist, const uint16_t debug_port, std::function<void()> reload_handler)
        : hist(hist), debug_port(debug_port), start_time(util::get_epoch_milliseconds()), reload_handler(std::move(reload_handler))
    {
    }

    int command_evaluator::eval(std::string_view line, std::string &output)
    {
        // Trim surrounding whitespace.
        const size_t begin = line.find_first_not_of(" \t");
        if (begin == std::string_view::npos)
            return 0;
        line = line.substr(begin, line.find_last_not_of(" \t") - begin + 1);

        const size_t space = line.find(' ');
        const std::string_view command = line.substr(0, space);
        const std::string_view arg = (space == std::string_view::npos) ? std::string_view() : line.substr(space + 1);

        if (command == ".help")
        {
            output = HELP_TEXT;
        }
        else if (command == ".history")
        {
            const std::vector<std::string> lines = hist.get_lines();
            std::stringstream ss;
            for (size_t i = lines.size(); i > 0; i--)
                ss << std::setw(5) << (lines.size() - i + 1) << "  " << lines[i - 1] << "\n";
            output = ss.str();
        }
        else if (command == ".reload")
        {
            output = "Reloading...\n";
            if (reload_handler)
                reload_handler();
        }
        else if (command == "pid")
        {
            output = std::to_string(getpid()) + "\n";
        }
        else if (command == "port")
        {
            output = std::to_string(debug_port) + "\n";
        }
        else if (command == "uptime")
        {
            output = std::to_string((util::get_epoch_milliseconds() - start_time) / 1000) + "s\n";
        }
        else if (command == "echo")
        {
            output = std::string(arg) + "\n";
        }
        else if (command == "log")
        {
            LOG_INFO << arg;
            output.clear();
        }
        else
        {
            output = "Unknown command: " + std::string(command) + ". Type .help for the list of commands.\n";
            return -1;
        }

        return 0;
    }

} // namespace repl
