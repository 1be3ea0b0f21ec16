#include "Tempo/log.hpp"
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>

namespace Tempo::log {

namespace {
    std::atomic<LogLevel> s_level{ LogLevel::Info };

    char levelLetter(LogLevel level) {
        switch (level) {
            case LogLevel::Error: return 'E';
            case LogLevel::Warn:  return 'W';
            case LogLevel::Info:  return 'I';
            case LogLevel::Debug: return 'D';
            case LogLevel::Trace: return 'T';
            default:              return '-';
        }
    }
}

void setLevel(LogLevel level) {
    s_level.store(level);
}

LogLevel getLevel() {
    return s_level.load();
}

bool parseLevel(const std::string& text, LogLevel& out) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "off")   { out = LogLevel::Off;   return true; }
    if (lower == "error") { out = LogLevel::Error; return true; }
    if (lower == "warn")  { out = LogLevel::Warn;  return true; }
    if (lower == "info")  { out = LogLevel::Info;  return true; }
    if (lower == "debug") { out = LogLevel::Debug; return true; }
    if (lower == "trace") { out = LogLevel::Trace; return true; }
    return false;
}

std::string header(LogLevel level) {
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);

    return fmt::format("[{} {:%Y/%m/%d %H:%M:%S}.{:03}] ",
                       levelLetter(level), fmt::localtime(seconds), millis);
}

void write(LogLevel level, const std::string& message) {
    std::FILE* stream = (level <= LogLevel::Warn) ? stderr : stdout;
    fmt::print(stream, "{}{}\n", header(level), message);
}

} // namespace Tempo::log
