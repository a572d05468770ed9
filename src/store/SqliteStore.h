#pragma once
#include <string>
#include <vector>
#include "store/Store.h"

struct sqlite3;

namespace FtsQuery {
    /**
     * @brief Turn free text into a single FTS5 phrase
     *
     * Doubles every '"' and wraps the result in quotes, so operators
     * (OR, AND, NOT, NEAR, *, ^, column filters) are matched literally.
     */
    std::string sanitize(const std::string& query);
}

namespace TagCodec {
    /** Serialize tags into the JSON array stored in facts.tags */
    std::string encode(const std::vector<std::string>& tags);

    /** Parse facts.tags; malformed data yields an empty list */
    std::vector<std::string> decode(const std::string& json);

    /** The exact text a tag occupies inside an encoded array ("tag", JSON-escaped) */
    std::string needle(const std::string& tag);
}

/**
 * @brief SQLite-backed store
 *
 * One connection per process, opened in serialized threading mode so the
 * request loop, heartbeat task and shutdown hook can share it. WAL journal
 * plus a busy timeout lets several daemons write the same file.
 */
class SqliteStore : public IStore {
public:
    static constexpr const char* DatabaseFileName = "engram.db";

    /**
     * @brief Open (and migrate) <dataDir>/engram.db, creating dataDir if needed
     * @throws StoreError on open or migration failure
     */
    explicit SqliteStore(const std::string& dataDir, int busyTimeoutMs = 5000);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    const std::string& getPath() const { return dbPath; }

    Fact addFact(const std::string& content,
                 const std::vector<std::string>& tags,
                 const std::string& sourceDir) override;
    std::vector<Fact> getFacts(const std::string& query,
                               const std::vector<std::string>& tags,
                               const std::string& sourceDir,
                               int limit) override;
    std::optional<Fact> getFactById(int64_t id) override;
    void deleteFact(int64_t id) override;

    void registerInstance(const std::string& id, int pid, const std::string& directory) override;
    void heartbeat(const std::string& id) override;
    void unregisterInstance(const std::string& id) override;
    std::vector<Instance> getInstances() override;
    std::optional<Instance> getInstance(const std::string& id) override;
    void cleanupStaleInstances(std::chrono::milliseconds maxAge) override;

    Message sendMessage(const std::string& from,
                        const std::string& to,
                        const std::string& content) override;
    std::vector<Message> getMessages(const std::string& toInstance, bool unreadOnly) override;
    void markMessageRead(int64_t id) override;

private:
    std::string dbPath;
    sqlite3* db = nullptr;

    void migrate();
    void execScript(const char* sql, const char* what);
    [[noreturn]] void fail(const std::string& what, int rc) const;
};
