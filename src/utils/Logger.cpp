#include "utils/Logger.h"
#include <iostream>
#include <fstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace {
    const char* levelTag(LogLevel level) {
        switch (level) {
            case LogLevel::ERROR: return "[ERROR] ";
            case LogLevel::WARNING: return "[WARN] ";
            case LogLevel::INFO: return "[INFO] ";
            default: return "[DEBUG] ";
        }
    }
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

void Logger::write(LogLevel level, const std::string& message) {
    // Trim trailing newlines from message to avoid double spacing
    std::string trimmedMsg = message;
    while (!trimmedMsg.empty() && (trimmedMsg.back() == '\n' || trimmedMsg.back() == '\r')) {
        trimmedMsg.pop_back();
    }

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream stamp;
    stamp << std::put_time(&local, "[%Y-%m-%d %H:%M:%S] ");

    // 1. Log file for post-mortem debugging
    if (!logFilePath.empty()) {
        std::ofstream logFile(logFilePath, std::ios::app);
        if (logFile.is_open()) {
            logFile << stamp.str() << levelTag(level) << trimmedMsg << std::endl;
        }
    }

    // 2. stderr, one prefixed line per message line
    if (stderrEnabled) {
        std::stringstream ss(trimmedMsg);
        std::string line;
        while (std::getline(ss, line)) {
            std::cerr << "[engram] " << levelTag(level) << line << std::endl;
        }
    }
}
