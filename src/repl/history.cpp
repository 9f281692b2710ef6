#include "../pchheader.hpp"
#include "../util/util.hpp"
#include "history.hpp"

namespace repl
{
    constexpr mode_t HISTORY_FILE_PERMS = 0600;

    history::history(const size_t max_size) : max_size(max_size)
    {
    }

    /**
     * Loads the history from the given file. A missing or malformed file leaves the history empty.
     * @return 0 on success. -1 if the history could not be loaded.
     */
    int history::load(const std::string &file_path)
    {
        set_lines({});

        const int fd = open(file_path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd == -1)
        {
            LOG_DEBUG << errno << ": History file " << file_path << " could not be opened.";
            return -1;
        }

        std::string buf;
        const int read_res = util::read_from_fd(fd, buf);
        close(fd);
        if (read_res == -1)
        {
            LOG_DEBUG << "History file " << file_path << " could not be read.";
            return -1;
        }

        jsoncons::json d;
        try
        {
            d = jsoncons::json::parse(buf, jsoncons::strict_json_parsing());
        }
        catch (const std::exception &e)
        {
            LOG_DEBUG << "History file " << file_path << " is malformed. " << e.what();
            return -1;
        }

        if (!d.is_array())
        {
            LOG_DEBUG << "History file " << file_path << " is not a json array.";
            return -1;
        }

        std::vector<std::string> loaded;
        for (const auto &item : d.array_range())
        {
            if (!item.is_string())
            {
                LOG_DEBUG << "History file " << file_path << " contains a non-string entry.";
                return -1;
            }
            loaded.push_back(item.as<std::string>());
        }

        set_lines(std::move(loaded));
        return 0;
    }

    /**
     * Writes the history to the given file as a JSON array (most recent first).
     * @return 0 on success. -1 on failure.
     */
    int history::save(const std::string &file_path) const
    {
        jsoncons::json d(jsoncons::json_array_arg);
        {
            std::scoped_lock lock(history_mutex);
            d.reserve(lines.size());
            for (const std::string &line : lines)
                d.push_back(line);
        }

        std::string content;
        try
        {
            d.dump(content);
        }
        catch (const std::exception &e)
        {
            LOG_ERROR << "Converting history to json failed. " << e.what();
            return -1;
        }

        const int fd = open(file_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, HISTORY_FILE_PERMS);
        if (fd == -1)
        {
            LOG_ERROR << errno << ": Error opening history file " << file_path;
            return -1;
        }

        if (util::write_to_fd(fd, content) == -1)
        {
            LOG_ERROR << errno << ": Error writing history file " << file_path;
            close(fd);
            return -1;
        }

        close(fd);
        return 0;
    }

    /**
     * Records a submitted line. Blank lines and repeats of the latest line are skipped.
     */
    void history::add(std::string_view line)
    {
        if (line.find_first_not_of(" \t") == std::string_view::npos)
            return;

        std::scoped_lock lock(history_mutex);
        if (!lines.empty() && lines.front() == line)
            return;

        lines.insert(lines.begin(), std::string(line));
        if (lines.size() > max_size)
            lines.resize(max_size);
    }

    void history::set_lines(std::vector<std::string> new_lines)
    {
        std::scoped_lock lock(history_mutex);
        lines = std::move(new_lines);
        if (lines.size() > max_size)
            lines.resize(max_size);
    }

    std::vector<std::string> history::get_lines() const
    {
        std::scoped_lock lock(history_mutex);
        return lines;
    }

    size_t history::size() const
    {
        std::scoped_lock lock(history_mutex);
        return lines.size();
    }

} // namespace repl
