#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>

namespace keel {
namespace common {

/**
 * @brief Logging levels for conditional diagnostic output
 *
 * Program diagnostics (failed constraint checks, dispatch misses) are emitted
 * at WARN; per-stage tracing of the invocation pipeline at DEBUG/TRACE so it
 * costs one relaxed load when disabled.
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * @brief Structured log entry
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string module;
    std::string message;
    std::string error_code;
    std::unordered_map<std::string, std::string> context;
};

/// Receives every entry that passes the level filter instead of stdout
using LogSink = std::function<void(const LogEntry&)>;

/**
 * @brief Global logging configuration
 *
 * The level can be adjusted at runtime. Hosts install a sink to capture the
 * diagnostic lines a program emits during one invocation.
 */
class Logger {
public:
    /// Get the singleton logger instance
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /// Set current logging level
    void set_level(LogLevel level) noexcept {
        current_level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel level() const noexcept {
        return static_cast<LogLevel>(current_level_.load(std::memory_order_relaxed));
    }

    /// Enable/disable structured JSON logging
    void set_json_format(bool enabled) noexcept {
        json_format_.store(enabled, std::memory_order_relaxed);
    }

    /// Replace the output sink; an empty sink restores stdout
    void set_sink(LogSink sink) {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        sink_ = std::move(sink);
    }

    /// Check if debug logging is enabled
    bool is_debug_enabled() const noexcept {
        return current_level_.load(std::memory_order_relaxed) <= static_cast<int>(LogLevel::DEBUG);
    }

    /// Check if a specific level is enabled
    bool is_enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) >= current_level_.load(std::memory_order_relaxed);
    }

    /// Log with explicit module
    template<typename... Args>
    void log(LogLevel level, const std::string& module, Args&&... args) {
        if (!is_enabled(level)) return;

        std::ostringstream oss;
        (oss << ... << args);

        LogEntry entry{
            std::chrono::system_clock::now(),
            level,
            module,
            oss.str(),
            "",
            {}
        };

        process_log_entry(entry);
    }

    /// Log a structured message with context
    void log_structured(LogLevel level, const std::string& module,
                        const std::string& message, const std::string& error_code = "",
                        const std::unordered_map<std::string, std::string>& context = {}) {
        if (!is_enabled(level)) return;

        LogEntry entry{
            std::chrono::system_clock::now(),
            level,
            module,
            message,
            error_code,
            context
        };

        process_log_entry(entry);
    }

    std::string format_json(const LogEntry& entry) const;
    std::string format_text(const LogEntry& entry) const;

    static std::string level_to_string(LogLevel level);

    /// Parse "trace".."critical" (case-insensitive); false on unknown names
    static bool parse_level(const std::string& name, LogLevel& out);

private:
    Logger() : current_level_(static_cast<int>(LogLevel::INFO)), json_format_(false) {}

    std::atomic<int> current_level_;
    std::atomic<bool> json_format_;

    std::mutex sink_mutex_;
    LogSink sink_;

    void process_log_entry(const LogEntry& entry) {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        if (sink_) {
            sink_(entry);
            return;
        }
        if (json_format_.load(std::memory_order_relaxed)) {
            std::cout << format_json(entry) << std::endl;
        } else {
            std::cout << format_text(entry) << std::endl;
        }
    }
};

} // namespace common
} // namespace keel

/**
 * @brief Performance-conscious logging macros
 *
 * The first argument is the module tag. TRACE and DEBUG skip argument
 * formatting entirely when disabled.
 */
#define LOG_TRACE(...) \
    do { \
        if (keel::common::Logger::instance().is_enabled(keel::common::LogLevel::TRACE)) { \
            keel::common::Logger::instance().log(keel::common::LogLevel::TRACE, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_DEBUG(...) \
    do { \
        if (keel::common::Logger::instance().is_debug_enabled()) { \
            keel::common::Logger::instance().log(keel::common::LogLevel::DEBUG, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_INFO(...) \
    keel::common::Logger::instance().log(keel::common::LogLevel::INFO, __VA_ARGS__)

#define LOG_WARN(...) \
    keel::common::Logger::instance().log(keel::common::LogLevel::WARN, __VA_ARGS__)

#define LOG_ERROR(...) \
    keel::common::Logger::instance().log(keel::common::LogLevel::ERROR, __VA_ARGS__)

#define LOG_CRITICAL(...) \
    keel::common::Logger::instance().log(keel::common::LogLevel::CRITICAL, __VA_ARGS__)

/**
 * @brief Structured logging macro
 */
#define LOG_STRUCTURED(level, module, message, ...) \
    keel::common::Logger::instance().log_structured(level, module, message, ##__VA_ARGS__)
