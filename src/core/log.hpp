/**
 * Log — Leveled diagnostics written to stderr.
 *
 * Every line carries a bracketed component prefix ("[Scheduler] ...").
 * Threshold and target stream are process-wide; tests redirect the stream to
 * capture output.
 *
 * Usage:
 *   Log::warn("Action", "spawn '" + item + "': room '" + room + "' not found");
 */

#ifndef STORY_CORE_LOG_HPP
#define STORY_CORE_LOG_HPP

#include <cstddef>
#include <ostream>
#include <string>

namespace story {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    OFF
};

class Log {
public:
    static void set_level(LogLevel level) { level_ = level; }
    static LogLevel level() { return level_; }

    /** Redirect output. nullptr restores std::cerr. */
    static void set_stream(std::ostream* os) { stream_ = os; }

    static bool enabled(LogLevel level) {
        return level_ != LogLevel::OFF && level >= level_;
    }

    static void write(LogLevel level, const std::string& component,
                      const std::string& message);

    static void debug(const std::string& component, const std::string& message) {
        write(LogLevel::DEBUG, component, message);
    }
    static void info(const std::string& component, const std::string& message) {
        write(LogLevel::INFO, component, message);
    }
    static void warn(const std::string& component, const std::string& message) {
        write(LogLevel::WARN, component, message);
    }
    static void error(const std::string& component, const std::string& message) {
        write(LogLevel::ERROR, component, message);
    }

    // Warnings are counted even when filtered out by the threshold.
    static size_t warning_count() { return warnings_; }
    static void reset_counters() { warnings_ = 0; }

    static const char* level_name(LogLevel level);

    /**
     * Parse "debug", "info", "warn", "error" or "off" (case-insensitive).
     * @throws std::invalid_argument on anything else
     */
    static LogLevel parse_level(const std::string& name);

private:
    static LogLevel level_;
    static std::ostream* stream_;
    static size_t warnings_;
};

} // namespace story

#endif // STORY_CORE_LOG_HPP
