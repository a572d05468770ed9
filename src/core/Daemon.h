#pragma once
#include <istream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include "core/ConfigManager.h"
#include "core/SignalWatcher.h"
#include "instance/HeartbeatTask.h"
#include "instance/InstanceManager.h"
#include "store/SqliteStore.h"

/**
 * @brief One engram session: store, registration, heartbeat and the request loop
 *
 * run() blocks SIGINT, SIGTERM and SIGHUP in every thread and waits for them
 * on a SignalWatcher. Whichever comes first, end of input or a signal,
 * runs shutdown(): stop the heartbeat, then unregister.
 */
class Daemon {
public:
    explicit Daemon(Config config);
    ~Daemon();

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    /**
     * @brief Serve requests from in, answering on out
     * @return Process exit code (0 on end of input, 1 on startup or read failure)
     */
    int run(std::istream& in, std::ostream& out);

    /**
     * @brief Stop heartbeating and unregister; only the first call has any effect
     */
    void shutdown();

    const std::string& getInstanceId() const { return instanceId; }

private:
    Config config;
    std::string instanceId;

    std::mutex stateMtx;
    bool shutdownDone = false;
    bool registered = false;
    std::unique_ptr<SqliteStore> store;
    std::unique_ptr<InstanceManager> instances;
    std::unique_ptr<HeartbeatTask> heartbeat;

    SignalWatcher signals;

    void setupLogging();
    void onTerminationSignal(int sig);
};
