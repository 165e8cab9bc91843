#pragma once
#include <functional>
#include <optional>
#include <string>

namespace mcpcompose::log
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

inline std::string to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    default:
        return "UNKNOWN";
    }
}

/// Parse "DEBUG", "info", "WARN", ...; nullopt for anything else
std::optional<LogLevel> level_from_string(const std::string& s);

/// Optional sink replacing stderr output: (level, logger name, message)
using LogCallback = std::function<void(LogLevel, const std::string&, const std::string&)>;

void set_level(LogLevel level);
LogLevel level();
void set_callback(LogCallback callback);

void log(LogLevel level, const std::string& logger, const std::string& message);

inline void debug(const std::string& logger, const std::string& message)
{
    log(LogLevel::Debug, logger, message);
}
inline void info(const std::string& logger, const std::string& message)
{
    log(LogLevel::Info, logger, message);
}
inline void warning(const std::string& logger, const std::string& message)
{
    log(LogLevel::Warning, logger, message);
}
inline void error(const std::string& logger, const std::string& message)
{
    log(LogLevel::Error, logger, message);
}

} // namespace mcpcompose::log
