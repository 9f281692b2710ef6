#ifndef _HC_REPL_EVALUATOR_
#define _HC_REPL_EVALUATOR_

#include "../pchheader.hpp"
#include "history.hpp"

namespace repl
{
    /**
     * Evaluation engine hosted by the worker.
     */
    class evaluator
    {
    public:
        virtual ~evaluator()
        {
        }

        /**
         * Evaluates one input line.
         * @param line Submitted input line.
         * @param output Text to show to the operator.
         * @return 0 on success. -1 if the line could not be evaluated (output holds the reason).
         */
        virtual int eval(std::string_view line, std::string &output) = 0;
    };

    /**
     * Built-in console commands working on the live worker state.
     */
    class command_evaluator : public evaluator
    {
    private:
        const history &hist;
        const uint16_t debug_port;
        const uint64_t start_time;
        std::function<void()> reload_handler;

    public:
        command_evaluator(const history &hist, const uint16_t debug_port, std::function<void()> reload_handler);
        int eval(std::string_view line, std::string &output) override;
    };

} // namespace repl

#endif
