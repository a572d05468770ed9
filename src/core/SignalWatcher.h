#pragma once
#include <atomic>
#include <functional>
#include <thread>

/**
 * @brief Waits for SIGINT, SIGTERM or SIGHUP on a dedicated thread
 *
 * start() blocks those signals (and SIGUSR1) in the calling thread, so call
 * it before any other thread is spawned. The first termination signal is
 * handed to the callback and the watcher thread ends. stop() wakes the thread
 * with SIGUSR1 and joins it; a SIGUSR1 arriving from outside is ignored.
 */
class SignalWatcher {
public:
    using Handler = std::function<void(int)>;

    explicit SignalWatcher(Handler onSignal);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    void start();
    void stop();

    bool isRunning() const { return running; }

private:
    Handler onSignal;
    std::thread watcher;
    std::atomic<bool> stopping{false};
    std::atomic<bool> running{false};

    void loop();
};
