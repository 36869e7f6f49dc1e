#include "logger.h"

#include <algorithm>
#include <cctype>
#include <ctime>

namespace meshchat {

bool parse_log_level(const std::string& name, LogLevel& out_level) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") {
        out_level = LogLevel::DEBUG;
    } else if (upper == "INFO") {
        out_level = LogLevel::INFO;
    } else if (upper == "WARN" || upper == "WARNING") {
        out_level = LogLevel::WARN;
    } else if (upper == "ERROR") {
        out_level = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : min_level_(LogLevel::INFO), colors_enabled_(true), timestamps_enabled_(true),
      console_enabled_(true), file_enabled_(false) {
    is_terminal_ = isatty(fileno(stdout));
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.flush();
        log_file_.close();
    }
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

void Logger::set_console_logging_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_enabled_ = enabled;
}

bool Logger::is_console_logging_enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return console_enabled_;
}

bool Logger::set_log_file_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
    log_file_path_ = path;
    if (!file_enabled_) {
        return true;
    }
    return open_log_file_unlocked();
}

std::string Logger::get_log_file_path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_file_path_;
}

void Logger::set_file_logging_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    file_enabled_ = enabled;
    if (!enabled) {
        if (log_file_.is_open()) {
            log_file_.close();
        }
        return;
    }
    if (!open_log_file_unlocked()) {
        file_enabled_ = false;
    }
}

bool Logger::is_file_logging_enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_enabled_;
}

bool Logger::open_log_file_unlocked() {
    if (log_file_path_.empty()) {
        return false;
    }
    if (log_file_.is_open()) {
        return true;
    }
    log_file_.open(log_file_path_, std::ios::out | std::ios::app);
    if (!log_file_.is_open()) {
        std::cerr << "[ERROR] [logger] Cannot open log file " << log_file_path_ << std::endl;
        return false;
    }
    return true;
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < min_level_) {
        return;
    }

    if (console_enabled_) {
        std::string line = format_line(level, module, message, colors_enabled_ && is_terminal_);
        // Errors go to stderr so they survive stdout redirection
        if (level >= LogLevel::ERROR) {
            std::cerr << line;
            std::cerr.flush();
        } else {
            std::cout << line;
            std::cout.flush();
        }
    }

    if (file_enabled_ && log_file_.is_open()) {
        log_file_ << format_line(level, module, message, false);
        log_file_.flush();
    }
}

std::string Logger::format_line(LogLevel level, const std::string& module,
                                const std::string& message, bool colored) const {
    std::ostringstream oss;

    if (timestamps_enabled_) {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);
        oss << "[" << std::put_time(&local_tm, "%H:%M:%S");
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

    oss << " " << message << "\n";
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
        "\033[34m",  // Blue
        "\033[38;5;208m", // Orange
        "\033[38;5;141m", // Purple
        "\033[38;5;51m"   // Turquoise
    };

    size_t color_count = sizeof(colors) / sizeof(colors[0]);
    return colors[hash_string(module) % color_count];
}

uint32_t Logger::hash_string(const std::string& str) {
    uint32_t hash = 5381;
    for (char c : str) {
        hash = ((hash << 5) + hash) + static_cast<uint8_t>(c); // hash * 33 + c
    }
    return hash;
}

} // namespace meshchat
