#ifndef sandfs_CORE_LOGGER_HPP
#define sandfs_CORE_LOGGER_HPP

#include <string>
#include <cstdio>
#include <cstdarg>

namespace sandfs {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    NONE = 4
};

// Parse "debug", "info", "warn"/"warning", "error", "none"/"off" (case-insensitive).
// Unknown names yield `fallback`.
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

// One line per message:
//   [2026-01-01 12:00:00] [WARN] message
// At DEBUG level the line also carries "(Class::function) at file:line".
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    bool enabled(LogLevel level) const {
        return level != LogLevel::NONE && level >= level_;
    }

    // ANSI colors; on by default only when stderr is a terminal
    void set_color(bool on);
    bool color() const;

    // Destination of log lines (default stderr, not owned)
    void set_output(FILE* out);

    void log(LogLevel level, const char* file, int line, const char* func, const char* fmt, ...)
        __attribute__((format(printf, 6, 7)));

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    std::string format_prefix(LogLevel level, const char* file, int line, const char* func) const;

    LogLevel level_;
    bool color_;
    FILE* out_;
};

#define SANDFS_LOG(lvl, ...) \
    do { \
        if (sandfs::Logger::instance().enabled(lvl)) \
            sandfs::Logger::instance().log(lvl, __FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__); \
    } while (0)

// Convenience macros
#define LOG_DEBUG(...) SANDFS_LOG(sandfs::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  SANDFS_LOG(sandfs::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...)  SANDFS_LOG(sandfs::LogLevel::WARN, __VA_ARGS__)
#define LOG_ERROR(...) SANDFS_LOG(sandfs::LogLevel::ERROR, __VA_ARGS__)

} // namespace sandfs

#endif // sandfs_CORE_LOGGER_HPP
