#pragma once
///@file

#include "confcache/util/error.hh"
#include "confcache/util/configuration.hh"

#include <functional>

namespace confcache {

struct LoggerSettings : Config
{
    Setting<bool> showTrace{
        this,
        false,
        "show-trace",
        R"(
          Whether to print the chain of traces attached to an error, e.g.
          the property and codec that were being decoded when a cache
          stream turned out to be corrupt.
        )"};
};

extern LoggerSettings loggerSettings;

class Logger
{
public:

    virtual ~Logger() {}

    virtual void stop() {};

    virtual void log(Verbosity lvl, std::string_view s) = 0;

    void log(std::string_view s)
    {
        log(lvlInfo, s);
    }

    virtual void logEI(const ErrorInfo & ei) = 0;

    void logEI(Verbosity lvl, ErrorInfo ei)
    {
        ei.level = lvl;
        logEI(ei);
    }

    virtual void warn(const std::string & msg);
};

extern std::unique_ptr<Logger> logger;

std::unique_ptr<Logger> makeSimpleLogger();

/**
 * suppress msgs > this
 */
extern Verbosity verbosity;

/**
 * Print a message with the standard ErrorInfo format.
 * In general, use these 'log' macros for reporting problems that may require user
 * intervention or that need more explanation.  Use the 'print' macros for more
 * lightweight status messages.
 */
#define logErrorInfo(level, errorInfo...)                \
    do {                                                 \
        if ((level) <= confcache::verbosity) {           \
            confcache::logger->logEI((level), errorInfo); \
        }                                                \
    } while (0)

#define logError(errorInfo...) logErrorInfo(confcache::lvlError, errorInfo)
#define logWarning(errorInfo...) logErrorInfo(confcache::lvlWarn, errorInfo)

/**
 * Print a string message if the current log level is at least the specified
 * level. Note that this has to be implemented as a macro to ensure that the
 * arguments are evaluated lazily.
 */
#define printMsgUsing(loggerParam, level, args...)          \
    do {                                                    \
        auto __lvl = level;                                 \
        if (__lvl <= confcache::verbosity) {                \
            loggerParam->log(__lvl, confcache::fmt(args));  \
        }                                                   \
    } while (0)
#define printMsg(level, args...) printMsgUsing(confcache::logger, level, args)

#define printError(args...) printMsg(confcache::lvlError, args)
#define notice(args...) printMsg(confcache::lvlNotice, args)
#define printInfo(args...) printMsg(confcache::lvlInfo, args)
#define printTalkative(args...) printMsg(confcache::lvlTalkative, args)
#define debug(args...) printMsg(confcache::lvlDebug, args)
#define vomit(args...) printMsg(confcache::lvlVomit, args)

/**
 * if verbosity >= lvlWarn, print a message with a yellow 'warning:' prefix.
 */
template<typename... Args>
inline void warn(const std::string & fs, const Args &... args)
{
    boost::format f(fs);
    setExceptions(f);
    formatHelper(f, args...);
    logger->warn(f.str());
}

void writeToStderr(std::string_view s);

} // namespace confcache
