#include "core/log.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace story {

LogLevel Log::level_ = LogLevel::WARN;
std::ostream* Log::stream_ = nullptr;
size_t Log::warnings_ = 0;

void Log::write(LogLevel level, const std::string& component,
                const std::string& message) {
    if (level == LogLevel::WARN) warnings_++;
    if (!enabled(level)) return;

    std::ostream& os = stream_ ? *stream_ : std::cerr;
    os << '[' << component << "] ";
    if (level == LogLevel::WARN || level == LogLevel::ERROR) {
        os << level_name(level) << ": ";
    }
    os << message << '\n';
}

const char* Log::level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warning";
        case LogLevel::ERROR: return "error";
        case LogLevel::OFF:   return "off";
    }
    return "off";
}

LogLevel Log::parse_level(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (s == "debug") return LogLevel::DEBUG;
    if (s == "info")  return LogLevel::INFO;
    if (s == "warn" || s == "warning") return LogLevel::WARN;
    if (s == "error") return LogLevel::ERROR;
    if (s == "off" || s == "none") return LogLevel::OFF;
    throw std::invalid_argument("unknown log level: " + name);
}

} // namespace story
