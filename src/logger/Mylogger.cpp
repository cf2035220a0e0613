#include "Mylogger.hpp"

#include <iostream>
#include <mutex>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace logging = boost::log;

namespace jigsaw
{
    namespace
    {
        std::once_flag g_sinks_once;

        logging::trivial::severity_level toSeverity(MyLogger::Level level)
        {
            switch (level)
            {
            case MyLogger::Level::debug:
                return logging::trivial::debug;
            case MyLogger::Level::info:
                return logging::trivial::info;
            case MyLogger::Level::warning:
                return logging::trivial::warning;
            case MyLogger::Level::error:
                return logging::trivial::error;
            }
            return logging::trivial::info;
        }
    }

    void MyLogger::init(Level level, const std::string &log_file)
    {
        // Sinks are process wide; a second init only moves the filter.
        std::call_once(g_sinks_once, [&log_file]()
                       {
            logging::add_console_log(
                std::clog,
                logging::keywords::format = "[%TimeStamp%] [%Severity%]: %Message%");
            if (!log_file.empty())
            {
                logging::add_file_log(
                    logging::keywords::file_name = log_file,
                    logging::keywords::open_mode = std::ios_base::app,
                    logging::keywords::auto_flush = true,
                    logging::keywords::format = "[%TimeStamp%] [%Severity%]: %Message%");
            }
            logging::add_common_attributes(); });

        logging::core::get()->set_filter(logging::trivial::severity >= toSeverity(level));
    }

    MyLogger::Level MyLogger::levelFromVerbosity(int verbose)
    {
        if (verbose <= 1)
            return Level::debug;
        if (verbose == 2)
            return Level::info;
        return Level::warning;
    }

    void MyLogger::debug(const std::string &msg)
    {
        BOOST_LOG_TRIVIAL(debug) << msg;
    }

    void MyLogger::info(const std::string &msg)
    {
        BOOST_LOG_TRIVIAL(info) << msg;
    }

    void MyLogger::warning(const std::string &msg)
    {
        BOOST_LOG_TRIVIAL(warning) << msg;
    }

    void MyLogger::error(const std::string &msg)
    {
        BOOST_LOG_TRIVIAL(error) << msg;
    }
}
