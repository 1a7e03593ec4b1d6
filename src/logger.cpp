#include "logger.h"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <unistd.h>

namespace remotefm {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : min_level_(LogLevel::INFO), colors_enabled_(true), timestamps_enabled_(true) {
    is_terminal_ = isatty(fileno(stdout));
}

void Logger::set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_log_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::set_colors_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    colors_enabled_ = enabled;
}

void Logger::set_timestamps_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    timestamps_enabled_ = enabled;
}

void Logger::set_output_callback(LogOutputCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    output_callback_ = std::move(callback);
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < min_level_) {
        return;
    }

    std::string line = format_line(level, module, message);

    if (output_callback_) {
        output_callback_(level, module, line);
        return;
    }

    // Errors go to stderr, everything else to stdout
    if (level >= LogLevel::ERROR) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
}

std::string Logger::format_line(LogLevel level, const std::string& module, const std::string& message) const {
    std::ostringstream oss;
    // Callbacks get plain text
    bool use_colors = colors_enabled_ && is_terminal_ && !output_callback_;

    if (timestamps_enabled_) {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm;
        localtime_r(&time_t, &local_tm);
        oss << "[" << std::put_time(&local_tm, "%H:%M:%S");
        oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    }

    if (use_colors) {
        oss << get_color_code(level) << "[" << get_level_string(level) << "]\033[0m";
    } else {
        oss << "[" << get_level_string(level) << "]";
    }

    if (!module.empty()) {
        if (use_colors) {
            oss << " " << get_module_color(module) << "[" << module << "]\033[0m";
        } else {
            oss << " [" << module << "]";
        }
    }

    oss << " " << message;
    return oss.str();
}

const char* Logger::get_level_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

const char* Logger::get_color_code(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";  // Cyan
        case LogLevel::INFO:  return "\033[32m";  // Green
        case LogLevel::WARN:  return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m";  // Red
        default: return "";
    }
}

const char* Logger::get_module_color(const std::string& module) {
    static const char* colors[] = {
        "\033[35m",  // Magenta
        "\033[94m",  // Bright Blue
        "\033[95m",  // Bright Magenta
        "\033[96m",  // Bright Cyan
        "\033[93m",  // Bright Yellow
        "\033[92m",  // Bright Green
        "\033[38;5;208m", // Orange
        "\033[38;5;141m"  // Purple
    };

    // djb2
    uint32_t hash = 5381;
    for (char c : module) {
        hash = ((hash << 5) + hash) + static_cast<uint8_t>(c);
    }
    return colors[hash % (sizeof(colors) / sizeof(colors[0]))];
}

} // namespace remotefm
