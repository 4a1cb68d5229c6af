#include "log.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace
{
    struct LogState
    {
        std::ofstream out;
        LogLevel level{LogLevel::Off};
    };

    LogState &state()
    {
        static LogState s;
        return s;
    }
}

LogLevel parseLogLevel(const std::string &name)
{
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    if (n == "debug")
        return LogLevel::Debug;
    if (n == "info")
        return LogLevel::Info;
    if (n == "warn" || n == "warning")
        return LogLevel::Warn;
    if (n == "error")
        return LogLevel::Error;
    if (n == "off")
        return LogLevel::Off;
    throw std::runtime_error("unknown log level '" + name + "'");
}

const char *toString(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Off:
        return "OFF";
    }
    return "?";
}

bool Log::init(const std::string &path, LogLevel level)
{
    LogState &s = state();
    if (s.out.is_open())
        s.out.close();
    s.level = LogLevel::Off;
    if (level == LogLevel::Off)
        return true;
    s.out.open(path, std::ios::app);
    if (!s.out.good())
        return false;
    s.level = level;
    return true;
}

void Log::shutdown()
{
    LogState &s = state();
    s.out.close();
    s.level = LogLevel::Off;
}

bool Log::enabled(LogLevel level)
{
    const LogState &s = state();
    return level != LogLevel::Off && s.level != LogLevel::Off && level >= s.level;
}

void Log::write(LogLevel level, const std::string &message)
{
    if (!enabled(level))
        return;
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);
    LogState &s = state();
    s.out << std::put_time(&tm, "%F %T") << '.' << std::setw(3) << std::setfill('0') << ms
          << std::setfill(' ') << ' ' << toString(level) << ' ' << message << '\n';
    s.out.flush();
}
