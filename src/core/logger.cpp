#include <sandfs/core/logger.hpp>
#include <sandfs/core/utils.hpp>

#include <ctime>
#include <mutex>
#include <vector>
#include <unistd.h>

namespace sandfs {

namespace {

const char* COLOR_RESET = "\033[0m";
const char* COLOR_FUNCTION = "\033[36m";  // Cyan
const char* COLOR_LOCATION = "\033[33m";  // Yellow

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[34m";
        case LogLevel::INFO: return "\033[32m";
        case LogLevel::WARN: return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        default: return COLOR_RESET;
    }
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

// Serializes whole lines across threads
std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

// "std::string sandfs::Config::get_string(const std::string&, ...) const"
//   -> "Config::get_string"
std::string short_function_name(const char* pretty_function) {
    std::string sig = pretty_function ? pretty_function : "";

    size_t paren = sig.find('(');
    if (paren != std::string::npos) {
        sig.erase(paren);
    }

    // Drop template arguments, which may contain spaces
    std::string name;
    int depth = 0;
    for (size_t i = 0; i < sig.size(); ++i) {
        if (sig[i] == '<') ++depth;
        else if (sig[i] == '>' && depth > 0) --depth;
        else if (depth == 0) name += sig[i];
    }

    // Return type and qualifiers come before the last space
    size_t space = name.rfind(' ');
    if (space != std::string::npos) {
        name.erase(0, space + 1);
    }
    while (!name.empty() && (name[0] == '*' || name[0] == '&')) {
        name.erase(0, 1);
    }
    if (starts_with(name, "sandfs::")) {
        name.erase(0, 8);
    }
    return name;
}

} // namespace

LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
    std::string lower = to_lower(trim(name));
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "none" || lower == "off") return LogLevel::NONE;
    return fallback;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(LogLevel::INFO)
    , color_(isatty(STDERR_FILENO) == 1)
    , out_(stderr)
{}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_; }

void Logger::set_color(bool on) { color_ = on; }

bool Logger::color() const { return color_; }

void Logger::set_output(FILE* out) {
    std::lock_guard<std::mutex> lock(log_mutex());
    out_ = out ? out : stderr;
}

std::string Logger::format_prefix(LogLevel level, const char* file, int line,
                                  const char* func) const {
    time_t now = time(NULL);
    struct tm t;
    localtime_r(&now, &t);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &t);

    std::string prefix = std::string("[") + timestamp + "] ";
    std::string tag = std::string("[") + level_name(level) + "]";
    prefix += color_ ? level_color(level) + tag + COLOR_RESET : tag;

    if (level_ == LogLevel::DEBUG) {
        std::string where = "(" + short_function_name(func) + ")";
        std::string location = std::string(file) + ":" + std::to_string(line);
        if (color_) {
            prefix += std::string(" ") + COLOR_FUNCTION + where + COLOR_RESET +
                      " at " + COLOR_LOCATION + location + COLOR_RESET;
        } else {
            prefix += " " + where + " at " + location;
        }
    }
    return prefix + " ";
}

void Logger::log(LogLevel level, const char* file, int line, const char* func, const char* fmt, ...) {
    if (!enabled(level)) return;

    va_list args;
    va_start(args, fmt);
    va_list retry;
    va_copy(retry, args);

    char small[512];
    int needed = vsnprintf(small, sizeof(small), fmt, args);
    va_end(args);

    std::string message;
    if (needed < 0) {
        message = fmt;
    } else if (static_cast<size_t>(needed) < sizeof(small)) {
        message.assign(small, static_cast<size_t>(needed));
    } else {
        std::vector<char> big(static_cast<size_t>(needed) + 1);
        vsnprintf(big.data(), big.size(), fmt, retry);
        message.assign(big.data(), static_cast<size_t>(needed));
    }
    va_end(retry);

    std::string text = format_prefix(level, file, line, func) + message + "\n";

    std::lock_guard<std::mutex> lock(log_mutex());
    fputs(text.c_str(), out_);
    fflush(out_);
}

} // namespace sandfs
