#pragma once
// SQLite persistence: working memory and affinity scores on disk
//
// One database file, three tables:
//   short_term_memory(npc, player, seq, role, content, created_at)
//   short_term_expiry(npc, player, expires_at)
//   affinity(npc, player, score, updated_at)
// Statements are serialised per database; sqlite3 handles are not
// shared across threads without that lock.

#include "../relationships.hpp"
#include "../services.hpp"
#include "../types.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace colloquy {

// Owning handle to one open database
class SqliteDatabase {
public:
    // Throws std::runtime_error if the file cannot be opened or the schema created
    explicit SqliteDatabase(const std::string& path);
    ~SqliteDatabase();

    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    sqlite3* handle() const { return db_; }
    std::mutex& mutex() { return mutex_; }

    // Run statements with no result rows. Throws on error.
    void exec(const std::string& sql);

private:
    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

class SqliteShortTermStore : public ShortTermStore {
public:
    SqliteShortTermStore(std::shared_ptr<SqliteDatabase> db,
                         size_t limit = 10, int64_t ttl_ms = 3600000);

    Transcript history(const std::string& npc, const std::string& player) override;
    void append(const std::string& npc, const std::string& player,
                const std::string& role, const std::string& content) override;
    void extend_expiry(const std::string& npc, const std::string& player) override;
    void clear(const std::string& npc, const std::string& player) override;

private:
    // Caller holds the database mutex
    bool expired_locked(const std::string& npc, const std::string& player, Timestamp at);
    void clear_locked(const std::string& npc, const std::string& player);
    void touch_locked(const std::string& npc, const std::string& player, Timestamp at);

    std::shared_ptr<SqliteDatabase> db_;
    const size_t limit_;
    const int64_t ttl_ms_;
};

class SqliteScoreTable : public ScoreTable {
public:
    explicit SqliteScoreTable(std::shared_ptr<SqliteDatabase> db);

    std::optional<float> get(const std::string& npc, const std::string& player) override;
    void put(const std::string& npc, const std::string& player, float score) override;
    std::map<std::string, float> all_for(const std::string& player) override;

private:
    std::shared_ptr<SqliteDatabase> db_;
};

} // namespace colloquy
