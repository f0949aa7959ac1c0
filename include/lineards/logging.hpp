#ifndef LINEARDS_LOGGING_HPP
#define LINEARDS_LOGGING_HPP

#include <chrono>
#include <ctime>
#include <format>
#include <iostream>
#include <source_location>
#include <string_view>

#include "common.hpp"

namespace lineards {

// Carries the caller's location alongside the format string, so the source_location
// default argument can sit in front of the variadic pack.
struct LogFormat {
    LogFormat(const char* fmt,
              const std::source_location& loc = std::source_location::current())
        : text(fmt), location(loc) {}

    std::string_view text;
    std::source_location location;
};

[[nodiscard]] constexpr std::string_view level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
    }
    return "?";
}

// variadic templates for multiple arguments.
template<typename... Args>
void log_message(LogLevel level, LogFormat format, const Args&... args) {
    if (level < LOG_LEVEL) {
        return;
    }

    auto time_t_val = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()); // Get the current time and convert to "time_t".
    char time_str[20]; // create a buffer of characters.
    std::strftime(time_str, sizeof(time_str), "%Y-%m-%d %H:%M:%S", std::localtime(&time_t_val));

    std::cerr << std::format("[{}] {} {}:{} - ",
                             std::string_view(time_str),
                             level_name(level),
                             format.location.file_name(),
                             format.location.line());

    std::cerr << std::vformat(format.text, std::make_format_args(args...)) << '\n';
}

/*

Example Usage:
log_message(LogLevel::Info, "loaded {} elements from {}", 3, "argv");
log_message(LogLevel::Debug, "position rejected: {}", "stale");

Output:
[2025-03-06 18:05:12] INFO main.cpp:5 - loaded 3 elements from argv

*/

} // namespace lineards

#endif // LINEARDS_LOGGING_HPP
