#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "utils/TimeUtils.h"

/**
 * @brief A remembered piece of text, scoped to the directory that created it
 */
struct Fact {
    int64_t id = 0;
    std::string content;
    std::vector<std::string> tags;
    std::string sourceDir;
    Timestamp createdAt;
    Timestamp updatedAt;
};

/**
 * @brief A live daemon session bound to a working directory
 */
struct Instance {
    std::string id;
    int pid = 0;
    std::string directory;
    Timestamp startedAt;
    Timestamp lastHeartbeat;
};

/**
 * @brief A one-way note between two instances
 *
 * readAt is empty until the recipient has retrieved it.
 */
struct Message {
    int64_t id = 0;
    std::string fromInstance;
    std::string toInstance;
    std::string content;
    Timestamp createdAt;
    std::optional<Timestamp> readAt;
};

/**
 * @brief Storage failure (I/O, lock timeout, bad schema)
 */
class StoreError : public std::runtime_error {
public:
    StoreError(const std::string& message, int code)
        : std::runtime_error(message), resultCode(code) {}

    /** Underlying SQLite result code */
    int code() const { return resultCode; }

    /** True when another connection held the lock past the busy timeout */
    bool isBusy() const;

private:
    int resultCode;
};

/**
 * @brief Durable storage for facts, instances and messages
 *
 * Shared by every daemon on the machine. Each operation is its own
 * transaction; every operation may throw StoreError.
 * Single-entity lookups return an empty optional when nothing matches.
 */
class IStore {
public:
    static constexpr int MaxLimit = 1000;
    static constexpr int DefaultLimit = 100;

    virtual ~IStore() = default;

    // ========== Facts ==========

    virtual Fact addFact(const std::string& content,
                         const std::vector<std::string>& tags,
                         const std::string& sourceDir) = 0;

    /**
     * @brief Query facts, newest update first
     * @param query Free text, matched as one literal phrase (empty = no text filter)
     * @param tags Every tag must be present (empty = no tag filter)
     * @param sourceDir Exact directory match (empty = all directories)
     * @param limit Clamped to [1, MaxLimit]; <= 0 means DefaultLimit
     */
    virtual std::vector<Fact> getFacts(const std::string& query,
                                       const std::vector<std::string>& tags,
                                       const std::string& sourceDir,
                                       int limit) = 0;

    virtual std::optional<Fact> getFactById(int64_t id) = 0;
    virtual void deleteFact(int64_t id) = 0;

    // ========== Instances ==========

    /** Insert or replace; both timestamps reset to now. */
    virtual void registerInstance(const std::string& id, int pid, const std::string& directory) = 0;
    virtual void heartbeat(const std::string& id) = 0;
    virtual void unregisterInstance(const std::string& id) = 0;
    virtual std::vector<Instance> getInstances() = 0;
    virtual std::optional<Instance> getInstance(const std::string& id) = 0;
    virtual void cleanupStaleInstances(std::chrono::milliseconds maxAge) = 0;

    // ========== Messages ==========

    virtual Message sendMessage(const std::string& from,
                                const std::string& to,
                                const std::string& content) = 0;
    virtual std::vector<Message> getMessages(const std::string& toInstance, bool unreadOnly) = 0;
    virtual void markMessageRead(int64_t id) = 0;
};
