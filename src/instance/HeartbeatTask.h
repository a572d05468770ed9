#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include "instance/InstanceManager.h"

/**
 * @brief Periodically refreshes an instance's last-heartbeat
 *
 * stop() wakes the worker and joins it: once it returns no heartbeat is in
 * flight, so unregistration afterwards cannot be overtaken by one.
 */
class HeartbeatTask {
public:
    HeartbeatTask(InstanceManager& manager, std::string instanceId, std::chrono::milliseconds interval);
    ~HeartbeatTask();

    HeartbeatTask(const HeartbeatTask&) = delete;
    HeartbeatTask& operator=(const HeartbeatTask&) = delete;

    void start();
    void stop();

    bool isRunning() const { return running; }
    int getBeatCount() const { return beats; }

private:
    InstanceManager& manager;
    std::string instanceId;
    std::chrono::milliseconds interval;

    std::thread worker;
    std::mutex mtx;
    std::condition_variable cv;
    bool stopRequested = false;
    std::atomic<bool> running{false};
    std::atomic<int> beats{0};

    void loop();
};
