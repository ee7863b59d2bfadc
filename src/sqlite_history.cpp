// SQLite persistence for working memory and affinity scores

#include <colloquy/stores/sqlite_history.hpp>
#include <colloquy/log.hpp>

#include <stdexcept>

namespace colloquy {

namespace {

constexpr const char* COMPONENT = "sqlite";

const char* SCHEMA = R"SQL(
CREATE TABLE IF NOT EXISTS short_term_memory (
    npc        TEXT    NOT NULL,
    player     TEXT    NOT NULL,
    seq        INTEGER PRIMARY KEY AUTOINCREMENT,
    role       TEXT    NOT NULL,
    content    TEXT    NOT NULL,
    created_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_short_term_pair ON short_term_memory(npc, player, seq);
CREATE TABLE IF NOT EXISTS short_term_expiry (
    npc        TEXT    NOT NULL,
    player     TEXT    NOT NULL,
    expires_at INTEGER NOT NULL,
    PRIMARY KEY (npc, player)
);
CREATE TABLE IF NOT EXISTS affinity (
    npc        TEXT    NOT NULL,
    player     TEXT    NOT NULL,
    score      REAL    NOT NULL,
    updated_at INTEGER NOT NULL,
    PRIMARY KEY (npc, player)
);
)SQL";

// Prepared statement, finalized on scope exit
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT));
        return *this;
    }

    Statement& bind(int index, int64_t value) {
        check(sqlite3_bind_int64(stmt_, index, value));
        return *this;
    }

    Statement& bind(int index, double value) {
        check(sqlite3_bind_double(stmt_, index, value));
        return *this;
    }

    // True while there is a row to read
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw std::runtime_error(std::string("sqlite step failed: ") + sqlite3_errmsg(db_));
    }

    void run() {
        while (step()) {}
    }

    std::string text(int col) const {
        const char* s = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
        return s ? s : "";
    }

    int64_t integer(int col) const { return sqlite3_column_int64(stmt_, col); }
    double real(int col) const { return sqlite3_column_double(stmt_, col); }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite bind failed: ") + sqlite3_errmsg(db_));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════════
// SqliteDatabase
// ═══════════════════════════════════════════════════════════════════════════

SqliteDatabase::SqliteDatabase(const std::string& path) : path_(path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open database " + path + ": " + msg);
    }
    sqlite3_busy_timeout(db_, 2000);
    try {
        exec("PRAGMA journal_mode=WAL;");
        exec(SCHEMA);
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    COLLOQUY_LOG_DEBUG(COMPONENT, "Opened %s", path.c_str());
}

SqliteDatabase::~SqliteDatabase() {
    if (db_) sqlite3_close(db_);
}

void SqliteDatabase::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw std::runtime_error("sqlite exec failed on " + path_ + ": " + msg);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// SqliteShortTermStore
// ═══════════════════════════════════════════════════════════════════════════

SqliteShortTermStore::SqliteShortTermStore(std::shared_ptr<SqliteDatabase> db,
                                           size_t limit, int64_t ttl_ms)
    : db_(std::move(db)), limit_(limit), ttl_ms_(ttl_ms) {
    if (!db_) throw std::invalid_argument("SqliteShortTermStore needs a database");
}

bool SqliteShortTermStore::expired_locked(const std::string& npc, const std::string& player,
                                          Timestamp at) {
    Statement stmt(db_->handle(),
        "SELECT expires_at FROM short_term_expiry WHERE npc=? AND player=?");
    stmt.bind(1, npc).bind(2, player);
    if (!stmt.step()) return false;
    return stmt.integer(0) <= at;
}

void SqliteShortTermStore::clear_locked(const std::string& npc, const std::string& player) {
    Statement rows(db_->handle(), "DELETE FROM short_term_memory WHERE npc=? AND player=?");
    rows.bind(1, npc).bind(2, player).run();
    Statement expiry(db_->handle(), "DELETE FROM short_term_expiry WHERE npc=? AND player=?");
    expiry.bind(1, npc).bind(2, player).run();
}

void SqliteShortTermStore::touch_locked(const std::string& npc, const std::string& player,
                                        Timestamp at) {
    Statement stmt(db_->handle(),
        "INSERT INTO short_term_expiry(npc, player, expires_at) VALUES(?, ?, ?) "
        "ON CONFLICT(npc, player) DO UPDATE SET expires_at=excluded.expires_at");
    stmt.bind(1, npc).bind(2, player).bind(3, static_cast<int64_t>(at + ttl_ms_)).run();
}

Transcript SqliteShortTermStore::history(const std::string& npc, const std::string& player) {
    std::lock_guard<std::mutex> lock(db_->mutex());
    if (expired_locked(npc, player, now())) {
        clear_locked(npc, player);
        return {};
    }

    // Newest `limit` rows, returned oldest first
    Statement stmt(db_->handle(),
        "SELECT role, content FROM ("
        "  SELECT seq, role, content FROM short_term_memory"
        "  WHERE npc=? AND player=? ORDER BY seq DESC LIMIT ?"
        ") ORDER BY seq ASC");
    stmt.bind(1, npc).bind(2, player).bind(3, static_cast<int64_t>(limit_));

    Transcript out;
    while (stmt.step()) {
        out.push_back(Message{stmt.text(0), stmt.text(1)});
    }
    return out;
}

void SqliteShortTermStore::append(const std::string& npc, const std::string& player,
                                  const std::string& role, const std::string& content) {
    std::lock_guard<std::mutex> lock(db_->mutex());
    Timestamp at = now();
    if (expired_locked(npc, player, at)) {
        clear_locked(npc, player);
    }

    db_->exec("BEGIN IMMEDIATE");
    try {
        Statement insert(db_->handle(),
            "INSERT INTO short_term_memory(npc, player, role, content, created_at) "
            "VALUES(?, ?, ?, ?, ?)");
        insert.bind(1, npc).bind(2, player).bind(3, role).bind(4, trim(content))
              .bind(5, static_cast<int64_t>(at)).run();

        Statement trim_rows(db_->handle(),
            "DELETE FROM short_term_memory WHERE npc=? AND player=? AND seq NOT IN ("
            "  SELECT seq FROM short_term_memory WHERE npc=? AND player=?"
            "  ORDER BY seq DESC LIMIT ?)");
        trim_rows.bind(1, npc).bind(2, player).bind(3, npc).bind(4, player)
                 .bind(5, static_cast<int64_t>(limit_)).run();

        touch_locked(npc, player, at);
        db_->exec("COMMIT");
    } catch (const std::exception& e) {
        COLLOQUY_LOG_WARN(COMPONENT, "Append rolled back: %s", e.what());
        sqlite3_exec(db_->handle(), "ROLLBACK", nullptr, nullptr, nullptr);
        throw;
    }
}

void SqliteShortTermStore::extend_expiry(const std::string& npc, const std::string& player) {
    std::lock_guard<std::mutex> lock(db_->mutex());
    Statement stmt(db_->handle(),
        "UPDATE short_term_expiry SET expires_at=? WHERE npc=? AND player=?");
    stmt.bind(1, static_cast<int64_t>(now() + ttl_ms_)).bind(2, npc).bind(3, player).run();
}

void SqliteShortTermStore::clear(const std::string& npc, const std::string& player) {
    std::lock_guard<std::mutex> lock(db_->mutex());
    clear_locked(npc, player);
}

// ═══════════════════════════════════════════════════════════════════════════
// SqliteScoreTable
// ═══════════════════════════════════════════════════════════════════════════

SqliteScoreTable::SqliteScoreTable(std::shared_ptr<SqliteDatabase> db) : db_(std::move(db)) {
    if (!db_) throw std::invalid_argument("SqliteScoreTable needs a database");
}

std::optional<float> SqliteScoreTable::get(const std::string& npc, const std::string& player) {
    std::lock_guard<std::mutex> lock(db_->mutex());
    Statement stmt(db_->handle(), "SELECT score FROM affinity WHERE npc=? AND player=?");
    stmt.bind(1, npc).bind(2, player);
    if (!stmt.step()) return std::nullopt;
    return static_cast<float>(stmt.real(0));
}

void SqliteScoreTable::put(const std::string& npc, const std::string& player, float score) {
    std::lock_guard<std::mutex> lock(db_->mutex());
    Statement stmt(db_->handle(),
        "INSERT INTO affinity(npc, player, score, updated_at) VALUES(?, ?, ?, ?) "
        "ON CONFLICT(npc, player) DO UPDATE SET score=excluded.score, "
        "updated_at=excluded.updated_at");
    stmt.bind(1, npc).bind(2, player).bind(3, static_cast<double>(score))
        .bind(4, static_cast<int64_t>(now())).run();
}

std::map<std::string, float> SqliteScoreTable::all_for(const std::string& player) {
    std::lock_guard<std::mutex> lock(db_->mutex());
    Statement stmt(db_->handle(), "SELECT npc, score FROM affinity WHERE player=? ORDER BY npc");
    stmt.bind(1, player);
    std::map<std::string, float> out;
    while (stmt.step()) {
        out[stmt.text(0)] = static_cast<float>(stmt.real(1));
    }
    return out;
}

} // namespace colloquy
