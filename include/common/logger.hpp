#ifndef RIFT_LOGGER_HPP
#define RIFT_LOGGER_HPP

#include <string>
#include <fstream>
#include <mutex>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>

// Ordered by severity: a message is emitted when its level is <= the configured level.
enum class LogLevel {
    ERROR,
    WARNING,
    INFO,
    DEBUG
};

class Logger {
public:
    static Logger& instance();

    void init(const std::string& filename);
    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level);
    LogLevel get_level() const;
    bool is_enabled(LogLevel level) const;

    // Console echo is on by default; the headless server and the tests turn it off.
    void set_console_output(bool enabled);

    // Parses "error", "warn", "info" or "debug". Unknown names map to INFO.
    static LogLevel level_from_string(const std::string& name);

    // Helper for easy logging
    template<typename... Args>
    void log_args(LogLevel level, Args... args) {
        if (!is_enabled(level)) return;
        std::stringstream ss;
        (ss << ... << args);
        log(level, ss.str());
    }

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::ofstream log_file_;
    mutable std::mutex mutex_;
    LogLevel level_ = LogLevel::INFO;
    bool console_output_ = true;

    std::string level_to_string(LogLevel level);
    std::string get_timestamp();
};

// Global macros for easier usage
#define LOG_INFO(...) Logger::instance().log_args(LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...) Logger::instance().log_args(LogLevel::WARNING, __VA_ARGS__)
#define LOG_ERR(...)  Logger::instance().log_args(LogLevel::ERROR, __VA_ARGS__)
#define LOG_DEBUG(...) Logger::instance().log_args(LogLevel::DEBUG, __VA_ARGS__)

#endif // RIFT_LOGGER_HPP
