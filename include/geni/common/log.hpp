#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace geni
{
    enum class LogLevel
    {
        DEBUG   = 0,
        INFO    = 1,
        WARNING = 2,
        ERROR   = 3,
        OFF     = 4
    };

    /**
     * Process-wide diagnostic logger
     * Writes "[LEVEL] message" lines to stderr, synchronously
     */
    class Logger
    {
    public:
        Logger(const Logger&)            = delete;
        Logger& operator=(const Logger&) = delete;

        static Logger& instance();

        void set_level(LogLevel level) { level_.store(level); }
        [[nodiscard]] LogLevel level() const { return level_.load(); }

        [[nodiscard]] bool enabled(LogLevel level) const { return level >= level_.load(); }

        // redirect output (tests), nullptr restores std::cerr
        void set_sink(std::ostream* sink);

        void write(LogLevel level, const std::string& message);

        static std::string level_to_string(LogLevel level);

        // accepts debug, info, warning|warn, error, off (case-insensitive)
        static LogLevel parse_level(const std::string& name);

    private:
        Logger() = default;

        std::atomic<LogLevel> level_{LogLevel::WARNING};
        std::ostream* sink_{nullptr};
        std::mutex mutex_;
    };
} // namespace geni

#define GENI_LOG(level, expr)                                    \
    do                                                           \
    {                                                            \
        if (::geni::Logger::instance().enabled(level))           \
        {                                                        \
            std::ostringstream geni_log_oss_;                    \
            geni_log_oss_ << expr;                               \
            ::geni::Logger::instance().write(level, geni_log_oss_.str()); \
        }                                                        \
    } while (false)

#define GENI_LOG_DEBUG(expr) GENI_LOG(::geni::LogLevel::DEBUG, expr)
#define GENI_LOG_INFO(expr)  GENI_LOG(::geni::LogLevel::INFO, expr)
#define GENI_LOG_WARN(expr)  GENI_LOG(::geni::LogLevel::WARNING, expr)
#define GENI_LOG_ERROR(expr) GENI_LOG(::geni::LogLevel::ERROR, expr)
