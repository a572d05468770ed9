#include "instance/HeartbeatTask.h"
#include "utils/Logger.h"

HeartbeatTask::HeartbeatTask(InstanceManager& manager, std::string instanceId, std::chrono::milliseconds interval)
    : manager(manager), instanceId(std::move(instanceId)), interval(interval) {}

HeartbeatTask::~HeartbeatTask() {
    stop();
}

void HeartbeatTask::start() {
    if (running) return;
    {
        std::lock_guard<std::mutex> lock(mtx);
        stopRequested = false;
    }
    running = true;
    worker = std::thread(&HeartbeatTask::loop, this);
}

void HeartbeatTask::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        stopRequested = true;
    }
    cv.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
    running = false;
}

void HeartbeatTask::loop() {
    std::unique_lock<std::mutex> lock(mtx);
    while (true) {
        if (cv.wait_for(lock, interval, [this] { return stopRequested; })) {
            break;
        }
        lock.unlock();
        try {
            manager.heartbeat(instanceId);
            ++beats;
        } catch (const StoreError& e) {
            Logger::getInstance().warn("Heartbeat for " + instanceId + " failed: " + e.what());
        }
        lock.lock();
    }
}
