#include "ledger.hpp"

#include "errors.hpp"
#include "url_utils.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {
const char* kArchiveExtension = ".zip";

const char* kCreateTable =
    "CREATE TABLE IF NOT EXISTS downloads ("
    " url TEXT PRIMARY KEY,"
    " filename TEXT,"
    " full_path TEXT,"
    " download_date TIMESTAMP DEFAULT CURRENT_TIMESTAMP,"
    " file_size INTEGER,"
    " status TEXT DEFAULT 'completed')";

// Columns added after the first schema; older files gain them on open.
const char* kColumns[] = {
    "filename TEXT",
    "full_path TEXT",
    "download_date TIMESTAMP",
    "file_size INTEGER",
    "status TEXT DEFAULT 'completed'",
};

// Finalizes a prepared statement on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw LedgerError(std::string("prepare failed: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind_text(int idx, const std::string& v) {
        sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
    }
    void bind_size(int idx, const std::optional<long long>& v) {
        if (v) sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(*v));
        else sqlite3_bind_null(stmt_, idx);
    }
    std::string column_text(int idx) const {
        const unsigned char* p = sqlite3_column_text(stmt_, idx);
        return p ? reinterpret_cast<const char*>(p) : std::string();
    }

    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};
} // namespace

// -------------------- ctor --------------------
Ledger::Ledger(const std::string& dbFile) : path_(dbFile) {
    if (sqlite3_open_v2(path_.c_str(), &db_,
                        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                        nullptr) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw LedgerError("cannot open " + path_ + ": " + msg);
    }
    sqlite3_busy_timeout(db_, 5000);
    try {
        exec("PRAGMA journal_mode=WAL");
        exec(kCreateTable);
        migrate();
    } catch (...) {
        close();
        throw;
    }
}

Ledger::~Ledger() {
    close();
}

void Ledger::close() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// -------------------- schema --------------------
void Ledger::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw LedgerError(msg);
    }
}

void Ledger::migrate() {
    for (const char* column : kColumns) {
        try {
            exec(std::string("ALTER TABLE downloads ADD COLUMN ") + column);
        } catch (const LedgerError& e) {
            // already present
            if (std::string(e.what()).find("duplicate column name") == std::string::npos) throw;
        }
    }
}

// -------------------- queries --------------------
std::optional<std::string> Ledger::lookup_filename(const std::string& url) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_) throw LedgerError("ledger is closed");
    Statement st(db_, "SELECT filename FROM downloads WHERE url = ?");
    st.bind_text(1, url);
    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_ROW) {
        // rows carried over from older schemas may have no filename
        if (sqlite3_column_type(st.get(), 0) == SQLITE_NULL) return std::nullopt;
        return st.column_text(0);
    }
    if (rc != SQLITE_DONE) throw LedgerError(std::string("lookup failed: ") + sqlite3_errmsg(db_));
    return std::nullopt;
}

bool Ledger::exists(const std::string& url, const std::string& downloadRoot) {
    auto filename = lookup_filename(url);
    if (!filename || filename->empty()) return false;
    if (ends_with_ci(*filename, kArchiveExtension)) return true;
    std::error_code ec;
    return fs::is_regular_file(fs::path(downloadRoot) / *filename, ec);
}

void Ledger::record(const std::string& url, const std::string& filename, const std::string& downloadRoot) {
    fs::path local = fs::path(downloadRoot) / filename;
    std::error_code ec;
    fs::path full = fs::absolute(local, ec);
    if (ec) full = local;
    std::optional<long long> size;
    auto bytes = fs::file_size(local, ec);
    if (!ec) size = static_cast<long long>(bytes);

    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_) throw LedgerError("ledger is closed");
    Statement st(db_,
                 "INSERT OR REPLACE INTO downloads"
                 " (url, filename, full_path, download_date, file_size, status)"
                 " VALUES (?, ?, ?, CURRENT_TIMESTAMP, ?, 'completed')");
    st.bind_text(1, url);
    st.bind_text(2, filename);
    st.bind_text(3, full.lexically_normal().string());
    st.bind_size(4, size);
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        throw LedgerError("cannot record " + url + ": " + sqlite3_errmsg(db_));
    }
}

std::optional<LedgerEntry> Ledger::find(const std::string& url) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_) throw LedgerError("ledger is closed");
    Statement st(db_,
                 "SELECT url, filename, full_path, download_date, file_size, status"
                 " FROM downloads WHERE url = ?");
    st.bind_text(1, url);
    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) throw LedgerError(std::string("lookup failed: ") + sqlite3_errmsg(db_));

    LedgerEntry e;
    e.url = st.column_text(0);
    e.filename = st.column_text(1);
    e.full_path = st.column_text(2);
    e.download_date = st.column_text(3);
    if (sqlite3_column_type(st.get(), 4) != SQLITE_NULL) e.file_size = sqlite3_column_int64(st.get(), 4);
    e.status = st.column_text(5);
    return e;
}
