#include "core/logging.hpp"
#include <chrono>
#include <ctime>
#include <iostream>

namespace Nebula::Log {

namespace {

    std::string timestamp()
    {
        using namespace std::chrono;
        auto now = system_clock::now();
        auto t = system_clock::to_time_t(now);
        std::tm tm {};
        localtime_r(&t, &tm);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        return buf;
    }

} // namespace

std::string_view to_string(Level level) noexcept
{
    switch (level) {
    case Level::Trace:
        return "TRACE";
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    case Level::Off:
        return "OFF";
    }
    return "?????";
}

Level parse_level(std::string_view name) noexcept
{
    if (name == "trace")
        return Level::Trace;
    if (name == "debug")
        return Level::Debug;
    if (name == "warn")
        return Level::Warn;
    if (name == "error")
        return Level::Error;
    if (name == "off")
        return Level::Off;
    return Level::Info;
}

Logger& Logger::instance()
{
    static Logger inst;
    return inst;
}

Logger::Logger()
    : out_(&std::clog)
{
}

void Logger::set_level(Level level) noexcept
{
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

Level Logger::level() const noexcept
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::set_output(std::ostream* os)
{
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = os != nullptr ? os : &std::clog;
}

void Logger::log(Level level, std::string_view msg)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < level_ || level == Level::Off)
        return;
    *out_ << timestamp() << " [" << to_string(level) << "] " << msg << '\n';
}

} // namespace Nebula::Log
