#include "counselscript/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstring>

namespace counselscript {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO:  return spdlog::level::info;
        case LogLevel::WARN:  return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::FATAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

} // namespace

class Logger::Impl {
public:
    std::shared_ptr<spdlog::logger> logger;

    Impl() {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::trace);

        logger = std::make_shared<spdlog::logger>("counselscript", console_sink);
        logger->set_level(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        logger->flush_on(spdlog::level::warn);
    }

    void add_file_sink(const std::string& filename) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, false);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->sinks().push_back(file_sink);
    }
};

LogLevel parse_log_level(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug" || lowered == "trace") return LogLevel::DEBUG;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "fatal" || lowered == "critical") return LogLevel::FATAL;
    return LogLevel::INFO;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : impl_(std::make_unique<Impl>()), level_(LogLevel::INFO) {}

Logger::~Logger() = default;

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    impl_->logger->set_level(to_spdlog(level));
}

LogLevel Logger::level() const {
    return level_.load();
}

void Logger::setOutputFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    impl_->add_file_sink(filename);
}

void Logger::write(LogLevel level, const char* file, int line, const char* func, const std::string& message) {
    // Extract filename from path
    const char* filename = std::strrchr(file, '/');
    if (!filename) filename = std::strrchr(file, '\\');
    filename = filename ? filename + 1 : file;

    impl_->logger->log(to_spdlog(level), "{}:{} {}() - {}", filename, line, func, message);
}

} // namespace counselscript
