#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace counselscript {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

LogLevel parse_log_level(std::string_view text);

// spdlog-backed process logger
class Logger {
public:
    static Logger& getInstance();

    void setLevel(LogLevel level);
    LogLevel level() const;

    // Adds a file sink next to the console sink
    void setOutputFile(const std::string& filename);

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, const char* func, Args&&... args) {
        if (level < level_.load(std::memory_order_relaxed)) return;

        std::ostringstream msg;
        (msg << ... << std::forward<Args>(args));
        write(level, file, line, func, msg.str());
    }

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(LogLevel level, const char* file, int line, const char* func, const std::string& message);

    class Impl;
    std::unique_ptr<Impl> impl_;
    std::atomic<LogLevel> level_;
    mutable std::mutex mutex_;
};

// Convenience macros
#define LOG_DEBUG(...) counselscript::Logger::getInstance().log(counselscript::LogLevel::DEBUG, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)  counselscript::Logger::getInstance().log(counselscript::LogLevel::INFO,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARN(...)  counselscript::Logger::getInstance().log(counselscript::LogLevel::WARN,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...) counselscript::Logger::getInstance().log(counselscript::LogLevel::ERROR, __FILE__, __LINE__, __func__, __VA_ARGS__)

inline void set_log_level(LogLevel level) {
    Logger::getInstance().setLevel(level);
}

inline void set_log_file(const std::string& filename) {
    Logger::getInstance().setOutputFile(filename);
}

} // namespace counselscript
