#pragma once
#include <string>
#include <mutex>
#include <fstream>

// NOTE: Avoid bare ERROR / DEBUG – they clash with common platform macros.
enum class LogLevel { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR };

class Logger {
public:
    /// Get the process-wide instance.
    static Logger& instance();

    /// Set (or change) the log output file. An empty path closes the file.
    void setLogFile(const std::string& path);

    /// Messages below this level are dropped. Default: LVL_INFO.
    void setLevel(LogLevel level);
    LogLevel level() const;

    /// Mirror every accepted line to stderr.
    void setEchoToStderr(bool enabled);

    /// Format: "[YYYY-MM-DD HH:MM:SS] [LEVEL] message"
    void log(LogLevel level, const std::string& message);

    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    /// Parse "debug" / "info" / "warn" / "error" (case-sensitive).
    /// Unknown names map to LVL_INFO.
    static LogLevel parseLevel(const std::string& name);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;

    static const char* levelToString(LogLevel level);
    static std::string currentTimestamp();

    mutable std::mutex mutex_;
    std::ofstream file_;
    LogLevel min_level_ = LogLevel::LVL_INFO;
    bool echo_stderr_ = false;
};
