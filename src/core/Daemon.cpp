#include "core/Daemon.h"
#include "mcp/McpServer.h"
#include "tools/BuiltinTools.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"
#include <filesystem>
#include <stdexcept>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

namespace fs = std::filesystem;

Daemon::Daemon(Config config)
    : config(std::move(config)), signals([this](int sig) { onTerminationSignal(sig); }) {}

Daemon::~Daemon() {
    signals.stop();
}

void Daemon::setupLogging() {
    auto& logger = Logger::getInstance();
    std::error_code ec;
    fs::create_directories(fs::u8path(config.dataDir), ec);
    if (ec) {
        logger.warn("Could not create data directory " + config.dataDir + ": " + ec.message());
    } else {
        logger.setLogFile(config.logFilePath());
    }
    logger.setMinLevel(config.enableDebug ? LogLevel::DEBUG : Logger::parseLevel(config.logLevel));
}

void Daemon::onTerminationSignal(int sig) {
    Logger::getInstance().info(std::string("Received ") + strsignal(sig) + ", shutting down");
    shutdown();
    std::_Exit(0);
}

void Daemon::shutdown() {
    std::lock_guard<std::mutex> lock(stateMtx);
    if (shutdownDone) return;
    shutdownDone = true;

    if (heartbeat) {
        heartbeat->stop();
    }
    if (registered && instances) {
        try {
            instances->unregister(instanceId);
        } catch (const StoreError& e) {
            Logger::getInstance().error("Failed to unregister " + instanceId + ": " + e.what());
        }
        registered = false;
    }
}

int Daemon::run(std::istream& in, std::ostream& out) {
    auto& logger = Logger::getInstance();
    try {
        signals.start();
    } catch (const std::runtime_error& e) {
        logger.error(e.what());
        return 1;
    }
    setupLogging();

    std::string workDir;
    {
        std::error_code ec;
        fs::path cwd = fs::current_path(ec);
        if (ec) {
            logger.error("Cannot determine working directory: " + ec.message());
            shutdown();
            return 1;
        }
        workDir = cwd.u8string();
    }

    {
        std::lock_guard<std::mutex> lock(stateMtx);
        if (shutdownDone) return 0;
        try {
            store = std::make_unique<SqliteStore>(config.dataDir, config.busyTimeoutMs);
        } catch (const StoreError& e) {
            logger.error(std::string("Failed to open store: ") + e.what());
            shutdownDone = true;
            return 1;
        }
        logger.info("Using database " + store->getPath());

        instances = std::make_unique<InstanceManager>(
            *store, std::chrono::seconds(config.staleAfterSeconds));
        instanceId = InstanceManager::generateInstanceId();
        try {
            instances->registerSelf(instanceId, static_cast<int>(getpid()), workDir);
        } catch (const StoreError& e) {
            logger.error("Failed to register instance: " + std::string(e.what()));
            shutdownDone = true;
            return 1;
        }
        registered = true;

        heartbeat = std::make_unique<HeartbeatTask>(
            *instances, instanceId, std::chrono::seconds(config.heartbeatIntervalSeconds));
        heartbeat->start();
    }

    ToolRegistry registry;
    registerBuiltinTools(registry, *store, *instances, SessionInfo{instanceId, workDir}, config.limits);

    auto channel = std::make_shared<OutputChannel>(out);
    McpServer server(registry, in, channel);

    int exitCode = 0;
    try {
        server.run();
    } catch (const std::runtime_error& e) {
        logger.error(std::string("Request loop failed: ") + e.what());
        exitCode = 1;
    }

    shutdown();
    return exitCode;
}
