#pragma once
#include <string>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <cstdlib>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "tools/ToolArgs.h"

struct Config {
    std::string dataDir;
    int busyTimeoutMs = 5000;
    int heartbeatIntervalSeconds = 30;
    int staleAfterSeconds = 300;
    std::string logLevel = "info";
    bool enableDebug = false;
    Limits limits;

    /** Where the settings came from ("" when built-in defaults were used) */
    std::string sourcePath;

    static std::string expandHome(const std::string& path) {
        if (path.empty() || path[0] != '~') return path;
        const char* home = std::getenv("HOME");
        if (!home || !*home) return path;
        return std::string(home) + path.substr(1);
    }

    static Config defaults() {
        Config cfg;
        cfg.dataDir = expandHome("~/.engram");
        applyEnvironment(cfg);
        return cfg;
    }

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }
        if (!j.is_object()) {
            throw std::runtime_error("Config root must be an object: " + pathStr);
        }

        Config cfg;
        int64_t maxFactSize = static_cast<int64_t>(cfg.limits.maxFactSize);
        int64_t maxTagCount = static_cast<int64_t>(cfg.limits.maxTagCount);
        int64_t maxTagLength = static_cast<int64_t>(cfg.limits.maxTagLength);
        int64_t maxMessageSize = static_cast<int64_t>(cfg.limits.maxMessageSize);
        try {
            cfg.dataDir = expandHome(j.value("data_dir", std::string("~/.engram")));
            cfg.busyTimeoutMs = j.value("busy_timeout_ms", 5000);
            cfg.heartbeatIntervalSeconds = j.value("heartbeat_interval_seconds", 30);
            cfg.staleAfterSeconds = j.value("stale_after_seconds", 300);
            cfg.logLevel = j.value("log_level", std::string("info"));
            cfg.enableDebug = j.value("enable_debug", false);

            if (j.contains("limits")) {
                const auto& l = j.at("limits");
                maxFactSize = l.value("max_fact_size", maxFactSize);
                maxTagCount = l.value("max_tag_count", maxTagCount);
                maxTagLength = l.value("max_tag_length", maxTagLength);
                maxMessageSize = l.value("max_message_size", maxMessageSize);
            }
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config value in " + pathStr + ": " + e.what());
        }

        if (cfg.heartbeatIntervalSeconds <= 0 || cfg.staleAfterSeconds <= 0 || cfg.busyTimeoutMs < 0) {
            throw std::runtime_error("Config intervals must be positive: " + pathStr);
        }
        if (maxFactSize < 0 || maxTagCount < 0 || maxTagLength < 0 || maxMessageSize < 0) {
            throw std::runtime_error("Config limits must not be negative: " + pathStr);
        }
        cfg.limits.maxFactSize = static_cast<size_t>(maxFactSize);
        cfg.limits.maxTagCount = static_cast<size_t>(maxTagCount);
        cfg.limits.maxTagLength = static_cast<size_t>(maxTagLength);
        cfg.limits.maxMessageSize = static_cast<size_t>(maxMessageSize);

        cfg.sourcePath = pathStr;
        applyEnvironment(cfg);
        return cfg;
    }

    /**
     * @brief Pick the config for this run
     *
     * Order: explicit path, $ENGRAM_CONFIG, <dataDir>/config.json, defaults.
     * An explicitly named file that is missing or malformed is an error.
     */
    static Config resolve(const std::string& argPath) {
        if (!argPath.empty()) {
            return load(argPath);
        }
        const char* envPath = std::getenv("ENGRAM_CONFIG");
        if (envPath && *envPath) {
            return load(envPath);
        }
        Config cfg = defaults();
        std::filesystem::path candidate = std::filesystem::u8path(cfg.dataDir) / "config.json";
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec)) {
            return load(candidate.u8string());
        }
        return cfg;
    }

    std::string logFilePath() const {
        return (std::filesystem::u8path(dataDir) / "engram.log").u8string();
    }

private:
    static void applyEnvironment(Config& cfg) {
        const char* dir = std::getenv("ENGRAM_DATA_DIR");
        if (dir && *dir) {
            cfg.dataDir = expandHome(dir);
        }
    }
};
