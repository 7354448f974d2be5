#include "geni/common/log.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace geni
{
    Logger& Logger::instance()
    {
        static Logger logger;
        return logger;
    }

    void Logger::set_sink(std::ostream* sink)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = sink;
    }

    void Logger::write(const LogLevel level, const std::string& message)
    {
        if (!enabled(level) || level == LogLevel::OFF)
            return;

        std::lock_guard<std::mutex> lock(mutex_);
        std::ostream& out = sink_ ? *sink_ : std::cerr;
        out << "[" << level_to_string(level) << "] " << message << std::endl;
    }

    std::string Logger::level_to_string(const LogLevel level)
    {
        switch (level)
        {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARNING: return "WARNING";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::OFF: return "OFF";
            default: return "UNKNOWN";
        }
    }

    LogLevel Logger::parse_level(const std::string& name)
    {
        std::string lower(name);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "debug") return LogLevel::DEBUG;
        if (lower == "info") return LogLevel::INFO;
        if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
        if (lower == "error") return LogLevel::ERROR;
        if (lower == "off") return LogLevel::OFF;
        throw std::invalid_argument("Unknown log level: " + name);
    }
} // namespace geni
