#include "store/SqliteStore.h"
#include "utils/Logger.h"
#include <sqlite3.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {

const char* kSchema = R"SQL(
BEGIN IMMEDIATE;

CREATE TABLE IF NOT EXISTS facts (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    content TEXT NOT NULL,
    tags TEXT NOT NULL DEFAULT '[]',
    source_dir TEXT NOT NULL,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_facts_source_dir ON facts(source_dir);
CREATE INDEX IF NOT EXISTS idx_facts_created_at ON facts(created_at);

CREATE VIRTUAL TABLE IF NOT EXISTS facts_fts USING fts5(content, content=facts, content_rowid=id);

CREATE TRIGGER IF NOT EXISTS facts_ai AFTER INSERT ON facts BEGIN
    INSERT INTO facts_fts(rowid, content) VALUES (new.id, new.content);
END;

CREATE TRIGGER IF NOT EXISTS facts_ad AFTER DELETE ON facts BEGIN
    INSERT INTO facts_fts(facts_fts, rowid, content) VALUES ('delete', old.id, old.content);
END;

CREATE TRIGGER IF NOT EXISTS facts_au AFTER UPDATE ON facts BEGIN
    INSERT INTO facts_fts(facts_fts, rowid, content) VALUES ('delete', old.id, old.content);
    INSERT INTO facts_fts(rowid, content) VALUES (new.id, new.content);
END;

CREATE TABLE IF NOT EXISTS instances (
    id TEXT PRIMARY KEY,
    pid INTEGER NOT NULL,
    directory TEXT NOT NULL,
    started_at INTEGER NOT NULL,
    last_heartbeat INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS messages (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    from_instance TEXT NOT NULL,
    to_instance TEXT NOT NULL,
    content TEXT NOT NULL,
    created_at INTEGER NOT NULL,
    read_at INTEGER
);

CREATE INDEX IF NOT EXISTS idx_messages_to ON messages(to_instance);
CREATE INDEX IF NOT EXISTS idx_messages_unread ON messages(to_instance, read_at);

COMMIT;
)SQL";

const char* kFactColumns = "f.id, f.content, f.tags, f.source_dir, f.created_at, f.updated_at";

[[noreturn]] void throwStoreError(sqlite3* db, const std::string& what, int rc) {
    std::string detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    throw StoreError(what + ": " + detail, rc);
}

// RAII wrapper for a prepared statement
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db(db) {
        int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            throwStoreError(db, "prepare failed", rc);
        }
    }

    ~Statement() {
        if (stmt) sqlite3_finalize(stmt);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }

    void bind(int index, int64_t value) {
        check(sqlite3_bind_int64(stmt, index, value));
    }

    /** @return true when a row is available, false when done */
    bool step() {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throwStoreError(db, "statement failed", rc);
    }

    /** Run a statement that returns no rows */
    void run() {
        while (step()) {
        }
    }

    std::string text(int col) const {
        const unsigned char* v = sqlite3_column_text(stmt, col);
        if (!v) return "";
        return std::string(reinterpret_cast<const char*>(v),
                           static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
    }

    int64_t int64(int col) const { return sqlite3_column_int64(stmt, col); }
    bool isNull(int col) const { return sqlite3_column_type(stmt, col) == SQLITE_NULL; }

private:
    sqlite3* db;
    sqlite3_stmt* stmt = nullptr;

    void check(int rc) {
        if (rc != SQLITE_OK) throwStoreError(db, "bind failed", rc);
    }
};

Fact factFromRow(const Statement& st) {
    Fact f;
    f.id = st.int64(0);
    f.content = st.text(1);
    f.tags = TagCodec::decode(st.text(2));
    f.sourceDir = st.text(3);
    f.createdAt = TimeUtils::fromMillis(st.int64(4));
    f.updatedAt = TimeUtils::fromMillis(st.int64(5));
    return f;
}

Instance instanceFromRow(const Statement& st) {
    Instance i;
    i.id = st.text(0);
    i.pid = static_cast<int>(st.int64(1));
    i.directory = st.text(2);
    i.startedAt = TimeUtils::fromMillis(st.int64(3));
    i.lastHeartbeat = TimeUtils::fromMillis(st.int64(4));
    return i;
}

Message messageFromRow(const Statement& st) {
    Message m;
    m.id = st.int64(0);
    m.fromInstance = st.text(1);
    m.toInstance = st.text(2);
    m.content = st.text(3);
    m.createdAt = TimeUtils::fromMillis(st.int64(4));
    if (!st.isNull(5)) {
        m.readAt = TimeUtils::fromMillis(st.int64(5));
    }
    return m;
}

int clampLimit(int limit) {
    if (limit <= 0) return IStore::DefaultLimit;
    if (limit > IStore::MaxLimit) return IStore::MaxLimit;
    return limit;
}

} // namespace

bool StoreError::isBusy() const {
    int primary = resultCode & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

namespace FtsQuery {

std::string sanitize(const std::string& query) {
    std::string out;
    out.reserve(query.size() + 2);
    out += '"';
    for (char c : query) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace FtsQuery

namespace TagCodec {

std::string encode(const std::vector<std::string>& tags) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& t : tags) arr.push_back(t);
    return arr.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::vector<std::string> decode(const std::string& json) {
    std::vector<std::string> tags;
    nlohmann::json parsed = nlohmann::json::parse(json, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        return tags;
    }
    for (const auto& item : parsed) {
        if (!item.is_string()) {
            return {};
        }
        tags.push_back(item.get<std::string>());
    }
    return tags;
}

std::string needle(const std::string& tag) {
    return nlohmann::json(tag).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace TagCodec

SqliteStore::SqliteStore(const std::string& dataDir, int busyTimeoutMs) {
    std::error_code ec;
    fs::create_directories(fs::u8path(dataDir), ec);
    if (ec) {
        throw StoreError("failed to create data directory " + dataDir + ": " + ec.message(), SQLITE_CANTOPEN);
    }
    dbPath = (fs::u8path(dataDir) / DatabaseFileName).u8string();

    int rc = sqlite3_open_v2(dbPath.c_str(), &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        if (db) {
            sqlite3_close(db);
            db = nullptr;
        }
        throw StoreError("failed to open database " + dbPath + ": " + detail, rc);
    }

    try {
        sqlite3_busy_timeout(db, busyTimeoutMs);
        execScript("PRAGMA journal_mode=WAL;", "failed to enable WAL");
        execScript("PRAGMA synchronous=NORMAL;", "failed to set synchronous mode");
        // FTS5 virtual table is written from triggers
        execScript("PRAGMA trusted_schema=ON;", "failed to set trusted_schema");
        migrate();
    } catch (const StoreError&) {
        sqlite3_close(db);
        db = nullptr;
        throw;
    }

    Logger::getInstance().debug("Opened store " + dbPath);
}

SqliteStore::~SqliteStore() {
    if (db) {
        sqlite3_close(db);
        db = nullptr;
    }
}

void SqliteStore::execScript(const char* sql, const char* what) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string detail = errMsg ? errMsg : sqlite3_errstr(rc);
        sqlite3_free(errMsg);
        throw StoreError(std::string(what) + ": " + detail, rc);
    }
}

void SqliteStore::migrate() {
    try {
        execScript(kSchema, "failed to migrate database");
    } catch (const StoreError&) {
        if (!sqlite3_get_autocommit(db)) {
            sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
        throw;
    }
}

void SqliteStore::fail(const std::string& what, int rc) const {
    throwStoreError(db, what, rc);
}

// ========== Facts ==========

Fact SqliteStore::addFact(const std::string& content,
                          const std::vector<std::string>& tags,
                          const std::string& sourceDir) {
    Timestamp now = TimeUtils::now();
    int64_t nowMs = TimeUtils::toMillis(now);

    Statement st(db, "INSERT INTO facts (content, tags, source_dir, created_at, updated_at) "
                     "VALUES (?, ?, ?, ?, ?) RETURNING id");
    st.bind(1, content);
    st.bind(2, TagCodec::encode(tags));
    st.bind(3, sourceDir);
    st.bind(4, nowMs);
    st.bind(5, nowMs);
    if (!st.step()) {
        fail("insert returned no id", SQLITE_ERROR);
    }

    Fact f;
    f.id = st.int64(0);
    f.content = content;
    f.tags = tags;
    f.sourceDir = sourceDir;
    f.createdAt = now;
    f.updatedAt = now;
    st.run();
    return f;
}

std::vector<Fact> SqliteStore::getFacts(const std::string& query,
                                        const std::vector<std::string>& tags,
                                        const std::string& sourceDir,
                                        int limit) {
    std::string sql = std::string("SELECT ") + kFactColumns + " FROM facts f";
    std::vector<std::string> conditions;

    if (!query.empty()) {
        sql += " JOIN facts_fts ON f.id = facts_fts.rowid";
        conditions.push_back("facts_fts MATCH ?");
    }
    if (!sourceDir.empty()) {
        conditions.push_back("f.source_dir = ?");
    }
    for (size_t i = 0; i < tags.size(); ++i) {
        conditions.push_back("instr(f.tags, ?) > 0");
    }

    for (size_t i = 0; i < conditions.size(); ++i) {
        sql += (i == 0 ? " WHERE " : " AND ");
        sql += conditions[i];
    }
    sql += " ORDER BY f.updated_at DESC, f.id DESC LIMIT ?";

    Statement st(db, sql);
    int idx = 1;
    if (!query.empty()) {
        st.bind(idx++, FtsQuery::sanitize(query));
    }
    if (!sourceDir.empty()) {
        st.bind(idx++, sourceDir);
    }
    for (const auto& tag : tags) {
        st.bind(idx++, TagCodec::needle(tag));
    }
    st.bind(idx, static_cast<int64_t>(clampLimit(limit)));

    std::vector<Fact> facts;
    while (st.step()) {
        facts.push_back(factFromRow(st));
    }
    return facts;
}

std::optional<Fact> SqliteStore::getFactById(int64_t id) {
    Statement st(db, std::string("SELECT ") + kFactColumns + " FROM facts f WHERE f.id = ?");
    st.bind(1, id);
    if (!st.step()) {
        return std::nullopt;
    }
    return factFromRow(st);
}

void SqliteStore::deleteFact(int64_t id) {
    Statement st(db, "DELETE FROM facts WHERE id = ?");
    st.bind(1, id);
    st.run();
}

// ========== Instances ==========

void SqliteStore::registerInstance(const std::string& id, int pid, const std::string& directory) {
    int64_t nowMs = TimeUtils::toMillis(TimeUtils::now());
    Statement st(db, "INSERT OR REPLACE INTO instances (id, pid, directory, started_at, last_heartbeat) "
                     "VALUES (?, ?, ?, ?, ?)");
    st.bind(1, id);
    st.bind(2, static_cast<int64_t>(pid));
    st.bind(3, directory);
    st.bind(4, nowMs);
    st.bind(5, nowMs);
    st.run();
}

void SqliteStore::heartbeat(const std::string& id) {
    Statement st(db, "UPDATE instances SET last_heartbeat = ? WHERE id = ?");
    st.bind(1, TimeUtils::toMillis(TimeUtils::now()));
    st.bind(2, id);
    st.run();
}

void SqliteStore::unregisterInstance(const std::string& id) {
    Statement st(db, "DELETE FROM instances WHERE id = ?");
    st.bind(1, id);
    st.run();
}

std::vector<Instance> SqliteStore::getInstances() {
    Statement st(db, "SELECT id, pid, directory, started_at, last_heartbeat FROM instances "
                     "ORDER BY started_at DESC, id ASC");
    std::vector<Instance> instances;
    while (st.step()) {
        instances.push_back(instanceFromRow(st));
    }
    return instances;
}

std::optional<Instance> SqliteStore::getInstance(const std::string& id) {
    Statement st(db, "SELECT id, pid, directory, started_at, last_heartbeat FROM instances WHERE id = ?");
    st.bind(1, id);
    if (!st.step()) {
        return std::nullopt;
    }
    return instanceFromRow(st);
}

void SqliteStore::cleanupStaleInstances(std::chrono::milliseconds maxAge) {
    int64_t cutoff = TimeUtils::toMillis(TimeUtils::now()) - maxAge.count();
    Statement st(db, "DELETE FROM instances WHERE last_heartbeat < ?");
    st.bind(1, cutoff);
    st.run();
}

// ========== Messages ==========

Message SqliteStore::sendMessage(const std::string& from,
                                 const std::string& to,
                                 const std::string& content) {
    Timestamp now = TimeUtils::now();
    Statement st(db, "INSERT INTO messages (from_instance, to_instance, content, created_at) "
                     "VALUES (?, ?, ?, ?) RETURNING id");
    st.bind(1, from);
    st.bind(2, to);
    st.bind(3, content);
    st.bind(4, TimeUtils::toMillis(now));
    if (!st.step()) {
        fail("insert returned no id", SQLITE_ERROR);
    }

    Message m;
    m.id = st.int64(0);
    m.fromInstance = from;
    m.toInstance = to;
    m.content = content;
    m.createdAt = now;
    st.run();
    return m;
}

std::vector<Message> SqliteStore::getMessages(const std::string& toInstance, bool unreadOnly) {
    std::string sql = "SELECT id, from_instance, to_instance, content, created_at, read_at "
                      "FROM messages WHERE to_instance = ?";
    if (unreadOnly) {
        sql += " AND read_at IS NULL";
    }
    sql += " ORDER BY created_at ASC, id ASC";

    Statement st(db, sql);
    st.bind(1, toInstance);
    std::vector<Message> messages;
    while (st.step()) {
        messages.push_back(messageFromRow(st));
    }
    return messages;
}

void SqliteStore::markMessageRead(int64_t id) {
    Statement st(db, "UPDATE messages SET read_at = ? WHERE id = ?");
    st.bind(1, TimeUtils::toMillis(TimeUtils::now()));
    st.bind(2, id);
    st.run();
}
