#ifndef _HC_REPL_HISTORY_
#define _HC_REPL_HISTORY_

#include "../pchheader.hpp"

namespace repl
{
    /**
     * Input line history. Most recent line first. Persisted as a JSON array of strings.
     */
    class history
    {
    private:
        const size_t max_size;
        std::vector<std::string> lines;
        mutable std::mutex history_mutex;

    public:
        explicit history(const size_t max_size);
        int load(const std::string &file_path);
        int save(const std::string &file_path) const;
        void add(std::string_view line);
        void set_lines(std::vector<std::string> new_lines);
        std::vector<std::string> get_lines() const;
        size_t size() const;
    };

} // namespace repl

#endif
