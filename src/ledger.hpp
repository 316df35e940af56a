#pragma once

#include <mutex>
#include <optional>
#include <string>

struct sqlite3;

struct LedgerEntry {
    std::string url;
    std::string filename;
    std::string full_path;
    std::string download_date;
    std::optional<long long> file_size;
    std::string status;
};

// Durable record of completed downloads, keyed by source URL, stored in a
// single SQLite file. One shared connection; every call is serialized.
class Ledger {
public:
    explicit Ledger(const std::string& dbFile);
    ~Ledger();

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    // A record exists and either names a .zip (extracted and deleted after
    // fetch, so trusted without a disk check) or its file is on disk.
    bool exists(const std::string& url, const std::string& downloadRoot);

    // Upserts the record for `url`, sizing the file under `downloadRoot`.
    void record(const std::string& url, const std::string& filename, const std::string& downloadRoot);

    std::optional<LedgerEntry> find(const std::string& url);

    void close();

private:
    void exec(const std::string& sql);
    void migrate();
    std::optional<std::string> lookup_filename(const std::string& url);

    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mtx_;
};
