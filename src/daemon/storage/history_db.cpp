#include "history_db.hpp"

#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

} // namespace

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path) {
    std::lock_guard lock(mutex_);

    fs::path p(path);
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "[holdtalk] db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    const char* insert_sql =
        "INSERT INTO transcriptions (mode, text, llm_response, models, language, "
        "duration, audio_path) VALUES (?, ?, ?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, mode, text, llm_response, models, language, "
        "duration, audio_path FROM transcriptions ORDER BY id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "[holdtalk] db: prepare insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "[holdtalk] db: prepare recent failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    return true;
}

void HistoryDb::close() {
    std::lock_guard lock(mutex_);
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

std::expected<void, std::string> HistoryDb::append(const HistoryEntry& entry) {
    std::lock_guard lock(mutex_);
    if (!insert_stmt_) return std::unexpected("history database is not open");

    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);

    auto bind_nullable = [this](int idx, const std::string& val) {
        if (val.empty()) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val.c_str(), -1, SQLITE_TRANSIENT);
    };

    sqlite3_bind_text(insert_stmt_, 1, entry.mode.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 2, entry.text.c_str(), -1, SQLITE_TRANSIENT);
    bind_nullable(3, entry.llm_response);
    bind_nullable(4, entry.models);
    bind_nullable(5, entry.language);
    sqlite3_bind_double(insert_stmt_, 6, entry.duration);
    bind_nullable(7, entry.audio_path);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        return std::unexpected(std::format("insert failed: {}", sqlite3_errmsg(db_)));
    }
    return {};
}

std::vector<HistoryEntry> HistoryDb::recent(int limit) {
    std::lock_guard lock(mutex_);
    std::vector<HistoryEntry> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        HistoryEntry e;
        e.id = sqlite3_column_int64(recent_stmt_, 0);
        e.timestamp = column_text(recent_stmt_, 1);
        e.mode = column_text(recent_stmt_, 2);
        e.text = column_text(recent_stmt_, 3);
        e.llm_response = column_text(recent_stmt_, 4);
        e.models = column_text(recent_stmt_, 5);
        e.language = column_text(recent_stmt_, 6);
        e.duration = sqlite3_column_double(recent_stmt_, 7);
        e.audio_path = column_text(recent_stmt_, 8);
        entries.push_back(std::move(e));
    }

    return entries;
}

int HistoryDb::prune_older_than(uint32_t days) {
    std::lock_guard lock(mutex_);
    if (!db_) return -1;

    auto cutoff = std::format("-{} days", days);

    sqlite3_stmt* select = nullptr;
    const char* select_sql =
        "SELECT audio_path FROM transcriptions "
        "WHERE timestamp < strftime('%Y-%m-%dT%H:%M:%f','now', ?) AND audio_path IS NOT NULL";
    if (sqlite3_prepare_v2(db_, select_sql, -1, &select, nullptr) != SQLITE_OK) {
        std::println(stderr, "[holdtalk] db: prepare prune failed: {}", sqlite3_errmsg(db_));
        return -1;
    }
    sqlite3_bind_text(select, 1, cutoff.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(select) == SQLITE_ROW) {
        std::error_code ec;
        fs::remove(column_text(select, 0), ec);
    }
    sqlite3_finalize(select);

    sqlite3_stmt* del = nullptr;
    const char* delete_sql =
        "DELETE FROM transcriptions "
        "WHERE timestamp < strftime('%Y-%m-%dT%H:%M:%f','now', ?)";
    if (sqlite3_prepare_v2(db_, delete_sql, -1, &del, nullptr) != SQLITE_OK) {
        std::println(stderr, "[holdtalk] db: prepare prune failed: {}", sqlite3_errmsg(db_));
        return -1;
    }
    sqlite3_bind_text(del, 1, cutoff.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(del);
    sqlite3_finalize(del);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "[holdtalk] db: prune failed: {}", sqlite3_errmsg(db_));
        return -1;
    }
    return sqlite3_changes(db_);
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS transcriptions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            mode TEXT NOT NULL,
            text TEXT NOT NULL,
            llm_response TEXT,
            models TEXT,
            language TEXT,
            duration REAL,
            audio_path TEXT
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "[holdtalk] db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
