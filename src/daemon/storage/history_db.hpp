#pragma once

#include "storage/history_log.hpp"

#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>

class HistoryDb : public HistoryLog {
public:
    HistoryDb();
    ~HistoryDb() override;

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    std::expected<void, std::string> append(const HistoryEntry& entry) override;

    std::vector<HistoryEntry> recent(int limit = 10);

    // Deletes rows older than days along with any audio files they retained.
    // Returns the number of rows removed, or -1 on error.
    int prune_older_than(uint32_t days);

private:
    bool create_tables();

    std::mutex mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
