#pragma once

#include <string>
#include <iostream>
#include <mutex>
#include <sstream>
#include <functional>
#include <cstdint>

namespace remotefm {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Receives every formatted log line that passes the level filter.
 * Installed by hosts that route logs somewhere other than the console.
 */
using LogOutputCallback = std::function<void(LogLevel level, const std::string& module, const std::string& line)>;

class Logger {
public:
    // Singleton pattern
    static Logger& getInstance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_log_level(LogLevel level);
    LogLevel get_log_level() const;

    void set_colors_enabled(bool enabled);
    void set_timestamps_enabled(bool enabled);

    /**
     * Redirect output to a callback instead of stdout/stderr.
     * Passing an empty callback restores console output.
     */
    void set_output_callback(LogOutputCallback callback);

    // Main logging function
    void log(LogLevel level, const std::string& module, const std::string& message);

private:
    Logger();

    std::string format_line(LogLevel level, const std::string& module, const std::string& message) const;
    static const char* get_level_string(LogLevel level);
    static const char* get_color_code(LogLevel level);
    static const char* get_module_color(const std::string& module);

    mutable std::mutex mutex_;
    LogLevel min_level_;
    bool colors_enabled_;
    bool timestamps_enabled_;
    bool is_terminal_;
    LogOutputCallback output_callback_;
};

} // namespace remotefm

// Convenience macros for easy logging
#define LOG_DEBUG(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        remotefm::Logger::getInstance().log(remotefm::LogLevel::DEBUG, module, oss.str()); \
    } while(0)

#define LOG_INFO(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        remotefm::Logger::getInstance().log(remotefm::LogLevel::INFO, module, oss.str()); \
    } while(0)

#define LOG_WARN(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        remotefm::Logger::getInstance().log(remotefm::LogLevel::WARN, module, oss.str()); \
    } while(0)

#define LOG_ERROR(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        remotefm::Logger::getInstance().log(remotefm::LogLevel::ERROR, module, oss.str()); \
    } while(0)
