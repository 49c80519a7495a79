#include "logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    if (!path.empty()) {
        file_.open(path, std::ios::out | std::ios::app);
    }
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::setEchoToStderr(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    echo_stderr_ = enabled;
}

void Logger::log(LogLevel level, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_) {
            return;
        }
    }

    std::ostringstream oss;
    oss << "[" << currentTimestamp() << "] [" << levelToString(level) << "] " << message;
    std::string line = oss.str();

    std::lock_guard<std::mutex> lock(mutex_);

    if (file_.is_open()) {
        file_ << line << "\n";
        file_.flush();
    }
    if (echo_stderr_) {
        std::cerr << line << std::endl;
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::LVL_DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::LVL_INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::LVL_WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::LVL_ERROR, message);
}

LogLevel Logger::parseLevel(const std::string& name) {
    if (name == "debug") return LogLevel::LVL_DEBUG;
    if (name == "warn")  return LogLevel::LVL_WARN;
    if (name == "error") return LogLevel::LVL_ERROR;
    return LogLevel::LVL_INFO;
}

const char* Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::LVL_DEBUG: return "DEBUG";
        case LogLevel::LVL_INFO:  return "INFO";
        case LogLevel::LVL_WARN:  return "WARN";
        case LogLevel::LVL_ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

std::string Logger::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}
