#include "mcpcompose/util/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace mcpcompose::log
{

namespace
{
std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_mutex;
LogCallback g_callback;
} // namespace

std::optional<LogLevel> level_from_string(const std::string& s)
{
    std::string up = s;
    std::transform(up.begin(), up.end(), up.begin(), ::toupper);
    if (up == "DEBUG")
        return LogLevel::Debug;
    if (up == "INFO")
        return LogLevel::Info;
    if (up == "WARNING" || up == "WARN")
        return LogLevel::Warning;
    if (up == "ERROR")
        return LogLevel::Error;
    return std::nullopt;
}

void set_level(LogLevel level)
{
    g_level.store(level);
}

LogLevel level()
{
    return g_level.load();
}

void set_callback(LogCallback callback)
{
    std::lock_guard<std::mutex> lock(g_mutex);
    g_callback = std::move(callback);
}

void log(LogLevel level, const std::string& logger, const std::string& message)
{
    if (static_cast<int>(level) < static_cast<int>(g_level.load()))
        return;

    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_callback)
    {
        g_callback(level, logger, message);
        return;
    }
    std::cerr << "[mcpcompose] " << to_string(level) << " " << logger << ": " << message
              << std::endl;
}

} // namespace mcpcompose::log
