#pragma once

#include <fmt/core.h>
#include <cstdio>
#include <string>
#include <utility>

namespace Tempo {

enum class LogLevel {
    Off = 0,
    Error,
    Warn,
    Info,
    Debug,
    Trace,
};

namespace log {

void setLevel(LogLevel level);
LogLevel getLevel();

// Parses "off", "error", "warn", "info", "debug" or "trace". Returns false on anything else.
bool parseLevel(const std::string& text, LogLevel& out);

// "[E 2024/01/31 12:00:00.042] "
std::string header(LogLevel level);

void write(LogLevel level, const std::string& message);

template<typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
    if (getLevel() >= LogLevel::Error) {
        write(LogLevel::Error, fmt::format(format, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args) {
    if (getLevel() >= LogLevel::Warn) {
        write(LogLevel::Warn, fmt::format(format, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) {
    if (getLevel() >= LogLevel::Info) {
        write(LogLevel::Info, fmt::format(format, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
    if (getLevel() >= LogLevel::Debug) {
        write(LogLevel::Debug, fmt::format(format, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void trace(fmt::format_string<Args...> format, Args&&... args) {
    if (getLevel() >= LogLevel::Trace) {
        write(LogLevel::Trace, fmt::format(format, std::forward<Args>(args)...));
    }
}

} // namespace log

} // namespace Tempo
