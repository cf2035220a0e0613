#ifndef JIGSAW_MYLOGGER_HPP
#define JIGSAW_MYLOGGER_HPP

#include <string>

namespace jigsaw
{
    // Thin front end over Boost.Log trivial logging.
    // Usable before init(): Boost.Log then prints every severity to the console.
    class MyLogger
    {
    public:
        enum class Level
        {
            debug,
            info,
            warning,
            error
        };

        // Install the console sink (and a file sink when log_file is not empty)
        // and drop everything below `level`.
        static void init(Level level, const std::string &log_file = "");

        // --verbose=1 shows everything, 2 hides per-fragment chatter, 3+ only problems.
        static Level levelFromVerbosity(int verbose);

        static void debug(const std::string &msg);
        static void info(const std::string &msg);
        static void warning(const std::string &msg);
        static void error(const std::string &msg);
    };
}

#endif // JIGSAW_MYLOGGER_HPP
