#include "instance/InstanceManager.h"
#include "utils/Logger.h"
#include <random>

InstanceManager::InstanceManager(IStore& store, std::chrono::milliseconds staleAfter)
    : store(store), staleAfter(staleAfter) {}

void InstanceManager::registerSelf(const std::string& id, int pid, const std::string& directory) {
    cleanupStale();
    store.registerInstance(id, pid, directory);
    Logger::getInstance().info("Registered instance " + id + " (pid " + std::to_string(pid) + ") in " + directory);
}

void InstanceManager::heartbeat(const std::string& id) {
    store.heartbeat(id);
}

void InstanceManager::unregister(const std::string& id) {
    store.unregisterInstance(id);
    Logger::getInstance().info("Unregistered instance " + id);
}

std::optional<Instance> InstanceManager::find(const std::string& id) {
    return store.getInstance(id);
}

std::vector<Instance> InstanceManager::listLive() {
    cleanupStale();
    return store.getInstances();
}

bool InstanceManager::cleanupStale() {
    try {
        store.cleanupStaleInstances(staleAfter);
        return true;
    } catch (const StoreError& e) {
        Logger::getInstance().warn(std::string("Stale instance cleanup failed: ") + e.what());
        return false;
    }
}

std::string InstanceManager::generateInstanceId() {
    static const char* hex = "0123456789abcdef";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dist(0, 15);

    std::string id;
    id.reserve(8);
    for (int i = 0; i < 8; ++i) {
        id += hex[dist(gen)];
    }
    return id;
}
