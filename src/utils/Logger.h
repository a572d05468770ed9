#pragma once
#include <string>
#include <functional>
#include <mutex>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

/**
 * @brief Process-wide logger
 *
 * stdout carries the protocol stream, so log lines only ever go to the
 * log file and to stderr.
 */
class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Set the log file path (empty disables file output)
     */
    void setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx);
        logFilePath = path;
    }

    void setMinLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx);
        minLevel = level;
    }

    void setStderrEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx);
        stderrEnabled = enabled;
    }

    void setCallback(LogCallback callback) {
        std::lock_guard<std::mutex> lock(mtx);
        this->callback = callback;
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mtx);
        if (level < minLevel) return;
        write(level, message);

        if (callback) {
            callback(level, message);
        }
    }

    // Convenience methods
    void debug(const std::string& m) { log(LogLevel::DEBUG, m); }
    void info(const std::string& m) { log(LogLevel::INFO, m); }
    void warn(const std::string& m) { log(LogLevel::WARNING, m); }
    void error(const std::string& m) { log(LogLevel::ERROR, m); }

    /**
     * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive)
     * @return INFO for anything unrecognized
     */
    static LogLevel parseLevel(const std::string& name);

private:
    Logger() = default;
    LogCallback callback;
    std::mutex mtx;
    std::string logFilePath;
    LogLevel minLevel = LogLevel::INFO;
    bool stderrEnabled = true;

    void write(LogLevel level, const std::string& message);
};
