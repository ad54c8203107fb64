/*
 * toolgate C++17 - Logger
 *
 * printf-style leveled logging to stderr. stdout is reserved for tool
 * results, so nothing in the process may log there.
 */
#ifndef toolgate_CORE_LOGGER_HPP
#define toolgate_CORE_LOGGER_HPP

#include <string>
#include <utility>
#include <mutex>
#include <cstdio>
#include <ctime>
#include <cstdarg>

namespace toolgate {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug", "info", "warn", "error" (case-insensitive).
// Returns false and leaves `out` untouched for anything else.
bool parse_log_level(const std::string& name, LogLevel& out);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    // Colors are on by default only when stderr is a terminal
    void set_color(bool enabled);

    void debug(const char* file, int line, const char* func, const char* fmt, ...);
    void info(const char* file, int line, const char* func, const char* fmt, ...);
    void warn(const char* file, int line, const char* func, const char* fmt, ...);
    void error(const char* file, int line, const char* func, const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);

    LogLevel level_;
    bool color_;
    std::mutex mutex_;
};

#define LOG_DEBUG(...) toolgate::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  toolgate::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  toolgate::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) toolgate::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace toolgate

#endif // toolgate_CORE_LOGGER_HPP
