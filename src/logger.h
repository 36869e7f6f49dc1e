#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <cstdint>

#include <unistd.h>

namespace meshchat {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Parse a level name ("debug", "INFO", "warning", ...)
 * @param name Level name, case insensitive
 * @param out_level Parsed level
 * @return true if the name was recognised
 */
bool parse_log_level(const std::string& name, LogLevel& out_level);

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

    // Console sink
    void set_console_logging_enabled(bool enabled);
    bool is_console_logging_enabled() const;

    // File sink (appends, no colours)
    bool set_log_file_path(const std::string& path);
    std::string get_log_file_path() const;
    void set_file_logging_enabled(bool enabled);
    bool is_file_logging_enabled() const;

    // Main logging function
    void log(LogLevel level, const std::string& module, const std::string& message);

private:
    Logger();
    ~Logger();

    std::string format_line(LogLevel level, const std::string& module,
                            const std::string& message, bool colored) const;
    static const char* get_level_string(LogLevel level);
    static const char* get_color_code(LogLevel level);
    static const char* get_module_color(const std::string& module);
    static uint32_t hash_string(const std::string& str);
    bool open_log_file_unlocked();

    mutable std::mutex mutex_;
    LogLevel min_level_;
    bool colors_enabled_;
    bool timestamps_enabled_;
    bool console_enabled_;
    bool file_enabled_;
    bool is_terminal_;
    std::string log_file_path_;
    std::ofstream log_file_;
};

} // namespace meshchat

// Convenience macros for easy logging
#define LOG_DEBUG(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        meshchat::Logger::getInstance().log(meshchat::LogLevel::DEBUG, module, oss.str()); \
    } while(0)

#define LOG_INFO(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        meshchat::Logger::getInstance().log(meshchat::LogLevel::INFO, module, oss.str()); \
    } while(0)

#define LOG_WARN(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        meshchat::Logger::getInstance().log(meshchat::LogLevel::WARN, module, oss.str()); \
    } while(0)

#define LOG_ERROR(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        meshchat::Logger::getInstance().log(meshchat::LogLevel::ERROR, module, oss.str()); \
    } while(0)
