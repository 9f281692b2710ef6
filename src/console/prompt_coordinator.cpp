#include "../pchheader.hpp"
#include "prompt_coordinator.hpp"

namespace console
{
    /**
     * No. of terminal columns taken by the given UTF-8 text (one per code point).
     */
    size_t display_width(std::string_view str)
    {
        size_t width = 0;
        for (const char c : str)
        {
            if ((c & 0xC0) != 0x80)
                width++;
        }
        return width;
    }

    prompt_coordinator::prompt_coordinator(util::writer &sink, const uint32_t debounce_ms)
        : sink(sink), redraw_timer(debounce_ms, [this]() { redraw(); })
    {
    }

    void prompt_coordinator::set_source(const line_source *source)
    {
        std::scoped_lock lock(coordinator_mutex);
        this->source = source;
    }

    /**
     * Emits a diagnostic chunk. Logging must not be used in here since log output itself
     * flows through this writer.
     */
    int prompt_coordinator::write(std::string_view data)
    {
        std::scoped_lock lock(coordinator_mutex);

        if (is_closing)
            return sink.write(data);

        std::string out;
        std::string prompt, buffer;
        if (source && source->current_line(prompt, buffer))
        {
            const size_t len = display_width(prompt) + display_width(buffer);
            out.reserve(len + 2 + data.size());
            out.append("\r").append(len, ' ').append("\r");
        }
        out.append(data);

        const int res = sink.write(out);
        redraw_timer.schedule();
        return res;
    }

    void prompt_coordinator::redraw()
    {
        std::scoped_lock lock(coordinator_mutex);
        if (is_closing || !source)
            return;

        std::string prompt, buffer;
        if (!source->current_line(prompt, buffer))
            return;

        sink.write(prompt + buffer);
    }

    /**
     * While closing, chunks pass through untouched and pending redraws are dropped.
     */
    void prompt_coordinator::set_closing(const bool closing)
    {
        std::scoped_lock lock(coordinator_mutex);
        is_closing = closing;
        if (closing)
            redraw_timer.cancel();
    }

    bool prompt_coordinator::redraw_pending()
    {
        return redraw_timer.is_pending();
    }

} // namespace console
