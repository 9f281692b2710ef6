#ifndef _HC_CONSOLE_PROMPT_COORDINATOR_
#define _HC_CONSOLE_PROMPT_COORDINATOR_

#include "../pchheader.hpp"
#include "../util/writer.hpp"
#include "../util/debounce_timer.hpp"

namespace console
{
    /**
     * Exposes the line currently being edited by the operator.
     */
    class line_source
    {
    public:
        virtual ~line_source()
        {
        }

        /**
         * Populates the prompt and the unsubmitted input.
         * @return True if the editor is awaiting input (a prompt is on screen).
         */
        virtual bool current_line(std::string &prompt, std::string &buffer) const = 0;
    };

    size_t display_width(std::string_view str);

    /**
     * Writer which keeps diagnostic output from colliding with the operator's input line.
     * Every chunk erases the visible prompt line first and a debounced redraw brings the prompt
     * and the unsubmitted input back once the burst of output is over.
     */
    class prompt_coordinator : public util::writer
    {
    private:
        util::writer &sink;
        const line_source *source = NULL;
        std::mutex coordinator_mutex;
        bool is_closing = false;
        util::debounce_timer redraw_timer; // Must be destroyed first. Its callback uses the members above.

        void redraw();

    public:
        prompt_coordinator(util::writer &sink, const uint32_t debounce_ms);
        void set_source(const line_source *source);
        int write(std::string_view data) override;
        void set_closing(const bool closing);
        bool redraw_pending();
    };

} // namespace console

#endif
