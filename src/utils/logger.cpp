#include "utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <stdexcept>

namespace bmc_2d {

namespace {
    const char* level_strings[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR"};
    const char* color_codes[] = {"\033[0;90m", "\033[0;36m", "\033[0;32m", "\033[0;33m", "\033[0;31m"};
    const char* reset_code = "\033[0m";
}

LogLevel string_to_log_level(const std::string& str) {
    std::string val = str;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (val == "trace") return LogLevel::TRACE;
    if (val == "debug") return LogLevel::DEBUG;
    if (val == "info")  return LogLevel::INFO;
    if (val == "warn" || val == "warning") return LogLevel::WARN;
    if (val == "error") return LogLevel::ERROR;
    throw std::invalid_argument("Unknown log level: " + str);
}

const char* log_level_to_string(LogLevel level) {
    return level_strings[static_cast<int>(level)];
}

Logger::Logger() {
    std::setvbuf(stdout, nullptr, _IONBF, 0);
}

Logger& Logger::get() {
    static Logger instance;
    return instance;
}

void Logger::set_level(LogLevel level) {
    level_ = level;
}

LogLevel Logger::get_level() const {
    return level_;
}

void Logger::set_colors(bool enabled) {
    colors_ = enabled;
}

void Logger::trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log(LogLevel::TRACE, fmt, args);
    va_end(args);
}

void Logger::debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log(LogLevel::DEBUG, fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log(LogLevel::INFO, fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log(LogLevel::WARN, fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log(LogLevel::ERROR, fmt, args);
    va_end(args);
}

void Logger::log(LogLevel level, const char* fmt, va_list args) {
    if (level_ > level) return;

    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&t, &local);

    std::printf("[%02d:%02d:%02d] ", local.tm_hour, local.tm_min, local.tm_sec);

    if (colors_) {
        std::printf("%s%s%s: ", color_codes[static_cast<int>(level)],
                   level_strings[static_cast<int>(level)], reset_code);
    } else {
        std::printf("%s: ", level_strings[static_cast<int>(level)]);
    }

    std::vprintf(fmt, args);
    std::printf("\n");
}

void Logger::flush() {
    std::fflush(stdout);
}

} // namespace bmc_2d
