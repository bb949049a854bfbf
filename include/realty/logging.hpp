/**
 * @file logging.hpp
 * @brief Realty Logging System
 *
 * Process-wide leveled logger with component tags. Output goes to std::cerr
 * unless redirected with set_log_sink().
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace realty {

/**
 * Log levels, ordered from most verbose (DEBUG) to least verbose (OFF).
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4
};

inline const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF:   return "OFF";
        default: return "UNKNOWN";
    }
}

/**
 * Parse a level name. Accepts upper or lower case and "WARNING".
 * Returns std::nullopt for anything else.
 */
inline std::optional<LogLevel> parse_log_level(const std::string& str) {
    if (str == "DEBUG" || str == "debug") return LogLevel::DEBUG;
    if (str == "INFO" || str == "info") return LogLevel::INFO;
    if (str == "WARN" || str == "warn" || str == "WARNING" || str == "warning") return LogLevel::WARN;
    if (str == "ERROR" || str == "error") return LogLevel::ERROR;
    if (str == "OFF" || str == "off") return LogLevel::OFF;
    return std::nullopt;
}

/**
 * Level named by the REALTY_LOG_LEVEL environment variable, if it is set
 * to a valid level name.
 */
inline std::optional<LogLevel> log_level_from_env() {
    const char* env = std::getenv("REALTY_LOG_LEVEL");
    if (!env) {
        return std::nullopt;
    }
    return parse_log_level(env);
}

inline LogLevel default_log_level() {
    return log_level_from_env().value_or(LogLevel::INFO);
}

/**
 * Logger singleton. The initial level is default_log_level().
 */
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void set_level(LogLevel level) {
        current_level_.store(level, std::memory_order_relaxed);
    }

    LogLevel get_level() const {
        return current_level_.load(std::memory_order_relaxed);
    }

    bool is_enabled(LogLevel level) const {
        LogLevel current = current_level_.load(std::memory_order_relaxed);
        return current != LogLevel::OFF && level >= current;
    }

    void set_show_timestamp(bool show) {
        show_timestamp_.store(show, std::memory_order_relaxed);
    }

    void set_show_component(bool show) {
        show_component_.store(show, std::memory_order_relaxed);
    }

    /**
     * Redirect output. Passing nullptr restores std::cerr.
     * The stream must outlive every log call made while it is installed.
     */
    void set_sink(std::ostream* sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = sink ? sink : &std::cerr;
    }

    template<typename... Args>
    void log(LogLevel level, const char* component, Args&&... args) {
        if (!is_enabled(level)) {
            return;
        }

        std::ostringstream oss;

        if (show_timestamp_.load(std::memory_order_relaxed)) {
            auto now = std::chrono::system_clock::now();
            auto time = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) % 1000;
            std::tm local{};
            localtime_r(&time, &local);
            oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
                << '.' << std::setfill('0') << std::setw(3) << ms.count() << ' ';
        }

        oss << '[' << log_level_to_string(level) << ']';

        if (show_component_.load(std::memory_order_relaxed) && component && component[0] != '\0') {
            oss << '[' << component << ']';
        }

        oss << ' ';
        ((oss << args), ...);

        std::lock_guard<std::mutex> lock(mutex_);
        *sink_ << oss.str() << std::endl;
    }

private:
    Logger()
        : current_level_(default_log_level())
        , show_timestamp_(false)
        , show_component_(true)
        , sink_(&std::cerr) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> current_level_;
    std::atomic<bool> show_timestamp_;
    std::atomic<bool> show_component_;
    std::mutex mutex_;
    std::ostream* sink_;
};

// ============================================================================
// Convenience functions
// ============================================================================

inline void set_log_level(LogLevel level) {
    Logger::instance().set_level(level);
}

inline LogLevel get_log_level() {
    return Logger::instance().get_level();
}

inline bool is_log_enabled(LogLevel level) {
    return Logger::instance().is_enabled(level);
}

inline void set_log_timestamp(bool show) {
    Logger::instance().set_show_timestamp(show);
}

inline void set_log_sink(std::ostream* sink) {
    Logger::instance().set_sink(sink);
}

// ============================================================================
// Logging macros
// ============================================================================

#define REALTY_LOG_DEBUG(component, ...) \
    do { \
        if (realty::Logger::instance().is_enabled(realty::LogLevel::DEBUG)) { \
            realty::Logger::instance().log(realty::LogLevel::DEBUG, component, __VA_ARGS__); \
        } \
    } while (0)

#define REALTY_LOG_INFO(component, ...) \
    do { \
        if (realty::Logger::instance().is_enabled(realty::LogLevel::INFO)) { \
            realty::Logger::instance().log(realty::LogLevel::INFO, component, __VA_ARGS__); \
        } \
    } while (0)

#define REALTY_LOG_WARN(component, ...) \
    do { \
        if (realty::Logger::instance().is_enabled(realty::LogLevel::WARN)) { \
            realty::Logger::instance().log(realty::LogLevel::WARN, component, __VA_ARGS__); \
        } \
    } while (0)

#define REALTY_LOG_ERROR(component, ...) \
    do { \
        if (realty::Logger::instance().is_enabled(realty::LogLevel::ERROR)) { \
            realty::Logger::instance().log(realty::LogLevel::ERROR, component, __VA_ARGS__); \
        } \
    } while (0)

} // namespace realty
