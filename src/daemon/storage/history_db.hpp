#pragma once

#include <cstdint>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryEntry {
    int64_t id = 0;
    std::string timestamp;
    std::string request_id;
    std::string source;      // "upload" or "url"
    std::string source_name; // filename or URL
    bool success = false;
    std::string text;
    std::string language;
    double audio_duration = 0.0;
    double processing_time = 0.0;
    std::string error;
};

// Log of completed transcription requests. Safe to share between threads.
class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const;

    // id and timestamp of the entry are assigned by the database.
    bool insert(const HistoryEntry& entry);

    std::vector<HistoryEntry> recent(int limit = 10);

private:
    bool create_tables();

    mutable std::mutex mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
