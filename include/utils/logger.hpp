#pragma once
#include <string>
#include <cstdio>
#include <cstdarg>

namespace bmc_2d {

enum class LogLevel { TRACE = 0, DEBUG = 1, INFO = 2, WARN = 3, ERROR = 4 };

LogLevel string_to_log_level(const std::string& str);
const char* log_level_to_string(LogLevel level);

class Logger {
public:
    static Logger& get();
    void set_level(LogLevel level);
    LogLevel get_level() const;
    void set_colors(bool enabled);
    bool enabled(LogLevel level) const { return level_ <= level; }

    void trace(const char* fmt, ...);
    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);
    void flush();
private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    void log(LogLevel level, const char* fmt, va_list args);
    LogLevel level_ = LogLevel::INFO;
    bool colors_ = true;
};

} // namespace bmc_2d
