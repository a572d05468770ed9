#include "core/SignalWatcher.h"
#include "utils/Logger.h"
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <string>
#include <pthread.h>

namespace {
    sigset_t watchedSignals() {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        sigaddset(&set, SIGHUP);
        sigaddset(&set, SIGUSR1);
        return set;
    }
}

SignalWatcher::SignalWatcher(Handler onSignal) : onSignal(std::move(onSignal)) {}

SignalWatcher::~SignalWatcher() {
    stop();
}

void SignalWatcher::start() {
    if (watcher.joinable()) return;
    sigset_t set = watchedSignals();
    // Threads started after this inherit the mask
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        throw std::runtime_error(std::string("pthread_sigmask failed: ") + std::strerror(rc));
    }
    stopping = false;
    running = true;
    watcher = std::thread(&SignalWatcher::loop, this);
}

void SignalWatcher::stop() {
    if (!watcher.joinable()) return;
    stopping = true;
    pthread_kill(watcher.native_handle(), SIGUSR1);
    watcher.join();
    running = false;
}

void SignalWatcher::loop() {
    sigset_t set = watchedSignals();
    while (true) {
        int sig = 0;
        int rc = sigwait(&set, &sig);
        if (rc != 0) {
            Logger::getInstance().error(std::string("sigwait failed, signals will not trigger shutdown: ") + std::strerror(rc));
            break;
        }
        if (sig == SIGUSR1) {
            if (stopping) break;
            Logger::getInstance().debug("Ignoring SIGUSR1");
            continue;
        }
        onSignal(sig);
        break;
    }
    running = false;
}
