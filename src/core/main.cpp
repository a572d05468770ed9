#include <iostream>
#include <string>
#include "core/ConfigManager.h"
#include "core/Daemon.h"
#include "utils/Logger.h"

static void printUsage() {
    std::cerr << "Usage: engram [config_path]" << std::endl;
    std::cerr << "  Serves memory and messaging tools over stdio (JSON-RPC 2.0, one message per line)." << std::endl;
    std::cerr << "  Config lookup: config_path, $ENGRAM_CONFIG, <data_dir>/config.json, built-in defaults." << std::endl;
}

int main(int argc, char* argv[]) {
    std::string configPath;
    if (argc >= 2) {
        std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        }
        configPath = arg;
    }
    if (argc > 2) {
        printUsage();
        return 1;
    }

    Config cfg;
    try {
        cfg = Config::resolve(configPath);
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Failed to load config: ") + e.what());
        printUsage();
        return 1;
    }
    if (!cfg.sourcePath.empty()) {
        Logger::getInstance().info("Loaded configuration from " + cfg.sourcePath);
    }

    std::ios::sync_with_stdio(false);
    Daemon session(cfg);
    return session.run(std::cin, std::cout);
}
