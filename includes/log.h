#pragma once
#include <sstream>
#include <string>

enum class LogLevel
{
    Debug,
    Info,
    Warn,
    Error,
    Off
};

LogLevel parseLogLevel(const std::string &name);
const char *toString(LogLevel level);

// Process-wide file log. The terminal belongs to the renderer, so messages
// go to a file. Nothing is written until init() succeeds.
class Log
{
public:
    // Returns false if the file could not be opened; logging stays off then.
    static bool init(const std::string &path, LogLevel level);
    static void shutdown();

    static bool enabled(LogLevel level);
    static void write(LogLevel level, const std::string &message);
};

#define LINESNAKE_LOG(level, expr)                    \
    do                                                \
    {                                                 \
        if (Log::enabled(level))                      \
        {                                             \
            std::ostringstream logStream_;            \
            logStream_ << expr;                       \
            Log::write(level, logStream_.str());      \
        }                                             \
    } while (0)

#define LOG_DEBUG(expr) LINESNAKE_LOG(LogLevel::Debug, expr)
#define LOG_INFO(expr) LINESNAKE_LOG(LogLevel::Info, expr)
#define LOG_WARN(expr) LINESNAKE_LOG(LogLevel::Warn, expr)
#define LOG_ERROR(expr) LINESNAKE_LOG(LogLevel::Error, expr)
