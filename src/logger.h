#pragma once

#include <string>
#include <iostream>
#include <mutex>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <cstdint>
#include <functional>
#include <algorithm>
#include <cctype>
#include <cstdio>

#include <unistd.h>

namespace peerlink {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Receives every formatted log line (without trailing newline).
 * When a sink is installed the console output is skipped.
 */
using LogSink = std::function<void(LogLevel level, const std::string& module, const std::string& line)>;

class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_log_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel get_log_level() {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    void set_colors_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        colors_enabled_ = enabled;
    }

    void set_timestamps_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        timestamps_enabled_ = enabled;
    }

    void set_sink(LogSink sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    void log(LogLevel level, const std::string& module, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (level < min_level_) {
            return;
        }

        bool colored = colors_enabled_ && is_terminal_ && !sink_;
        std::ostringstream oss;

        if (timestamps_enabled_) {
            auto now = std::chrono::system_clock::now();
            auto time_t = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) % 1000;

            oss << "[" << std::put_time(std::localtime(&time_t), "%H:%M:%S");
            oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
        }

        if (colored) {
            oss << get_color_code(level) << "[" << get_level_string(level) << "]" << "\033[0m";
        } else {
            oss << "[" << get_level_string(level) << "]";
        }

        if (!module.empty()) {
            if (colored) {
                oss << " " << get_module_color(module) << "[" << module << "]" << "\033[0m";
            } else {
                oss << " [" << module << "]";
            }
        }

        oss << " " << message;

        if (sink_) {
            sink_(level, module, oss.str());
            return;
        }

        if (level >= LogLevel::ERROR) {
            std::cerr << oss.str() << std::endl;
        } else {
            std::cout << oss.str() << std::endl;
        }
    }

    /**
     * Parse "debug", "info", "warn"/"warning" or "error" (any case).
     * @return false if the name is not recognised; level is left untouched
     */
    static bool parse_log_level(const std::string& name, LogLevel& level) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "debug") { level = LogLevel::DEBUG; return true; }
        if (lower == "info") { level = LogLevel::INFO; return true; }
        if (lower == "warn" || lower == "warning") { level = LogLevel::WARN; return true; }
        if (lower == "error") { level = LogLevel::ERROR; return true; }
        return false;
    }

private:
    Logger() : min_level_(LogLevel::INFO), colors_enabled_(true), timestamps_enabled_(true) {
        is_terminal_ = isatty(fileno(stdout));
    }

    static const char* get_level_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            default: return "UNKNOWN";
        }
    }

    static const char* get_color_code(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "\033[36m";  // Cyan
            case LogLevel::INFO:  return "\033[32m";  // Green
            case LogLevel::WARN:  return "\033[33m";  // Yellow
            case LogLevel::ERROR: return "\033[31m";  // Red
            default: return "";
        }
    }

    // Stable color per module tag (djb2 over the name)
    static const char* get_module_color(const std::string& module) {
        static const char* colors[] = {
            "\033[35m", "\033[94m", "\033[95m", "\033[96m",
            "\033[93m", "\033[92m", "\033[90m", "\033[34m",
            "\033[38;5;208m", "\033[38;5;141m", "\033[38;5;51m"
        };
        uint32_t hash = 5381;
        for (char c : module) {
            hash = ((hash << 5) + hash) + static_cast<uint8_t>(c);
        }
        return colors[hash % (sizeof(colors) / sizeof(colors[0]))];
    }

    std::mutex mutex_;
    LogLevel min_level_;
    bool colors_enabled_;
    bool timestamps_enabled_;
    bool is_terminal_;
    LogSink sink_;
};

} // namespace peerlink

#define LOG_DEBUG(module, message) \
    do { \
        std::ostringstream oss_; \
        oss_ << message; \
        peerlink::Logger::getInstance().log(peerlink::LogLevel::DEBUG, module, oss_.str()); \
    } while(0)

#define LOG_INFO(module, message) \
    do { \
        std::ostringstream oss_; \
        oss_ << message; \
        peerlink::Logger::getInstance().log(peerlink::LogLevel::INFO, module, oss_.str()); \
    } while(0)

#define LOG_WARN(module, message) \
    do { \
        std::ostringstream oss_; \
        oss_ << message; \
        peerlink::Logger::getInstance().log(peerlink::LogLevel::WARN, module, oss_.str()); \
    } while(0)

#define LOG_ERROR(module, message) \
    do { \
        std::ostringstream oss_; \
        oss_ << message; \
        peerlink::Logger::getInstance().log(peerlink::LogLevel::ERROR, module, oss_.str()); \
    } while(0)
