#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "store/Store.h"

/**
 * @brief Instance lifecycle policy over the store
 *
 * One staleness threshold is shared by listing and by the cleanup that
 * runs before a daemon registers itself. Registration always overwrites.
 */
class InstanceManager {
public:
    static constexpr std::chrono::minutes DefaultStaleAfter{5};

    explicit InstanceManager(IStore& store,
                             std::chrono::milliseconds staleAfter = DefaultStaleAfter);

    /**
     * @brief Reclaim crashed sessions, then register (or re-register) this one
     * @throws StoreError if the registration itself fails
     */
    void registerSelf(const std::string& id, int pid, const std::string& directory);

    void heartbeat(const std::string& id);
    void unregister(const std::string& id);
    std::optional<Instance> find(const std::string& id);

    /**
     * @brief Remove stale instances, then list the remaining ones
     */
    std::vector<Instance> listLive();

    /**
     * @brief Delete instances whose last heartbeat is older than the threshold
     * @return false if the cleanup failed (the failure is logged)
     */
    bool cleanupStale();

    std::chrono::milliseconds getStaleAfter() const { return staleAfter; }

    /** 8 lowercase hex characters */
    static std::string generateInstanceId();

private:
    IStore& store;
    std::chrono::milliseconds staleAfter;
};
