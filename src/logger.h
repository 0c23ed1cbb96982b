#pragma once

#include <iostream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <string>
#include <vector>
#include <stdexcept>

/**
 * Logging for the table store.
 * A Logger is an ordinary object owned by the caller (see RunContext), so
 * two pipelines in one process never share log state.
 */
namespace playledger {

/**
 * Log levels in increasing order of severity.
 */
enum class LogLevel {
    DEBUG,    // Detailed debugging information
    INFO,     // General informational messages
    WARNING,  // Warning messages (non-critical issues)
    ERROR     // Error messages (critical issues)
};

/**
 * Timestamped line logger with an optional in-memory capture buffer.
 */
class Logger {
public:
    /**
     * @param sink Stream to write lines to (nullptr disables output)
     * @param min_level Messages below this level are ignored
     */
    explicit Logger(std::ostream* sink = &std::cerr,
                    LogLevel min_level = LogLevel::INFO)
        : sink_(sink), min_level_(min_level), capture_(false) {}

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel level() const {
        return min_level_;
    }

    /**
     * Keep a copy of every emitted line (for result reporting and tests).
     */
    void enable_capture(bool enabled = true) {
        std::lock_guard<std::mutex> lock(mutex_);
        capture_ = enabled;
    }

    /**
     * Lines captured since capture was enabled.
     */
    std::vector<std::string> captured() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

    void clear_captured() {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.clear();
    }

    /**
     * Log a message at the specified level.
     */
    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (level < min_level_) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        std::tm tm;
        localtime_r(&time_t_now, &tm);

        // Format: [YYYY-MM-DD HH:MM:SS] [LEVEL] message
        std::ostringstream line;
        line << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "] ["
             << level_to_string(level) << "] " << message;

        if (sink_ != nullptr) {
            *sink_ << line.str() << "\n";
        }
        if (capture_) {
            lines_.push_back(line.str());
        }
    }

    void debug(const std::string& message) {
        log(LogLevel::DEBUG, message);
    }

    void info(const std::string& message) {
        log(LogLevel::INFO, message);
    }

    void warning(const std::string& message) {
        log(LogLevel::WARNING, message);
    }

    void error(const std::string& message) {
        log(LogLevel::ERROR, message);
    }

    // Holds a mutex and a stream pointer
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    static const char* level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:   return "DEBUG";
            case LogLevel::INFO:    return "INFO";
            case LogLevel::WARNING: return "WARN";
            case LogLevel::ERROR:   return "ERROR";
            default:                return "UNKNOWN";
        }
    }

    mutable std::mutex mutex_;
    std::ostream* sink_;
    LogLevel min_level_;
    bool capture_;
    std::vector<std::string> lines_;
};

/**
 * Parse a level name ("debug", "info", "warning"/"warn", "error").
 * Throws std::runtime_error for anything else.
 */
inline LogLevel parse_log_level(const std::string& name) {
    if (name == "debug" || name == "DEBUG") return LogLevel::DEBUG;
    if (name == "info" || name == "INFO") return LogLevel::INFO;
    if (name == "warning" || name == "warn" || name == "WARNING") return LogLevel::WARNING;
    if (name == "error" || name == "ERROR") return LogLevel::ERROR;
    throw std::runtime_error("Unknown log level: " + name);
}

// Convenience macros; ctx is anything with a logger() accessor (RunContext)
#define PLAYLEDGER_LOG_DEBUG(ctx, msg) (ctx).logger().debug(msg)
#define PLAYLEDGER_LOG_INFO(ctx, msg) (ctx).logger().info(msg)
#define PLAYLEDGER_LOG_WARNING(ctx, msg) (ctx).logger().warning(msg)
#define PLAYLEDGER_LOG_ERROR(ctx, msg) (ctx).logger().error(msg)

} // namespace playledger
