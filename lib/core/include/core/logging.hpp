#pragma once

#include <cstdint>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace Nebula::Log {

enum class Level : std::uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

[[nodiscard]] std::string_view to_string(Level level) noexcept;

// Accepts "trace", "debug", "info", "warn", "error", "off"; anything else maps to Info.
[[nodiscard]] Level parse_level(std::string_view name) noexcept;

// Process-wide, thread-safe. Writes "<timestamp> [LEVEL] message" lines.
class Logger {
public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(Level level) noexcept;
    [[nodiscard]] Level level() const noexcept;
    [[nodiscard]] bool enabled(Level level) const noexcept { return level >= this->level() && level != Level::Off; }

    // The sink must outlive every later log call; nullptr restores std::clog.
    void set_output(std::ostream* os);

    void log(Level level, std::string_view msg);

private:
    Logger();

    mutable std::mutex mutex_;
    std::ostream* out_;
    Level level_ = Level::Info;
};

// Collects << into a string, emitted on destruction.
class LogStream {
public:
    explicit LogStream(Level level)
        : level_(level)
    {
    }

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template <typename T>
    LogStream& operator<<(const T& v)
    {
        ss_ << v;
        return *this;
    }

    ~LogStream() { Logger::instance().log(level_, ss_.str()); }

private:
    Level level_;
    std::ostringstream ss_;
};

} // namespace Nebula::Log

// The message expression is only evaluated when the level is enabled.
#define NEBULA_LOG(lvl, msg)                                   \
    do {                                                       \
        if (::Nebula::Log::Logger::instance().enabled(lvl)) {  \
            ::Nebula::Log::LogStream(lvl) << msg;              \
        }                                                      \
    } while (0)

#define NEBULA_TRACE(msg) NEBULA_LOG(::Nebula::Log::Level::Trace, msg)
#define NEBULA_DEBUG(msg) NEBULA_LOG(::Nebula::Log::Level::Debug, msg)
#define NEBULA_INFO(msg) NEBULA_LOG(::Nebula::Log::Level::Info, msg)
#define NEBULA_WARN(msg) NEBULA_LOG(::Nebula::Log::Level::Warn, msg)
#define NEBULA_ERROR(msg) NEBULA_LOG(::Nebula::Log::Level::Error, msg)
