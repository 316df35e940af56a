#include <catch2/catch_test_macros.hpp>

#include "errors.hpp"
#include "ledger.hpp"
#include "test_support.hpp"

#include <sqlite3.h>

#include <thread>
#include <vector>

TEST_CASE("record then exists requires the file on disk") {
    TempDir dir;
    const std::string root = (dir.path() / "out").string();
    write_file(dir.path() / "out" / "sub" / "a.bin", "hello");

    Ledger ledger((dir.path() / "ledger.db").string());
    CHECK_FALSE(ledger.exists("https://h/r/sub/a.bin", root));

    ledger.record("https://h/r/sub/a.bin", "sub/a.bin", root);
    CHECK(ledger.exists("https://h/r/sub/a.bin", root));

    auto e = ledger.find("https://h/r/sub/a.bin");
    REQUIRE(e);
    CHECK(e->filename == "sub/a.bin");
    CHECK(e->status == "completed");
    REQUIRE(e->file_size);
    CHECK(*e->file_size == 5);
    CHECK(fs::path(e->full_path).is_absolute());
    CHECK(fs::path(e->full_path).filename() == "a.bin");
    CHECK_FALSE(e->download_date.empty());

    fs::remove(dir.path() / "out" / "sub" / "a.bin");
    CHECK_FALSE(ledger.exists("https://h/r/sub/a.bin", root));
}

TEST_CASE("zip records are trusted without a disk check") {
    TempDir dir;
    Ledger ledger((dir.path() / "ledger.db").string());
    ledger.record("https://h/r/Game.ZIP", "Game.ZIP", dir.str());
    auto e = ledger.find("https://h/r/Game.ZIP");
    REQUIRE(e);
    CHECK_FALSE(e->file_size.has_value());
    CHECK(ledger.exists("https://h/r/Game.ZIP", dir.str()));
}

TEST_CASE("re-recording a URL replaces the entry") {
    TempDir dir;
    Ledger ledger((dir.path() / "ledger.db").string());
    write_file(dir.path() / "x.bin", "1");
    ledger.record("https://h/r/x.bin", "x.bin", dir.str());
    write_file(dir.path() / "x.bin", "12345678");
    ledger.record("https://h/r/x.bin", "x.bin", dir.str());

    auto e = ledger.find("https://h/r/x.bin");
    REQUIRE(e);
    CHECK(*e->file_size == 8);

    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open((dir.path() / "ledger.db").string().c_str(), &db) == SQLITE_OK);
    sqlite3_stmt* st = nullptr;
    REQUIRE(sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM downloads", -1, &st, nullptr) == SQLITE_OK);
    REQUIRE(sqlite3_step(st) == SQLITE_ROW);
    CHECK(sqlite3_column_int(st, 0) == 1);
    sqlite3_finalize(st);
    sqlite3_close(db);
}

TEST_CASE("opening an older store adds missing columns") {
    TempDir dir;
    const std::string file = (dir.path() / "old.db").string();
    {
        sqlite3* db = nullptr;
        REQUIRE(sqlite3_open(file.c_str(), &db) == SQLITE_OK);
        REQUIRE(sqlite3_exec(db,
                             "CREATE TABLE downloads (url TEXT PRIMARY KEY, filename TEXT,"
                             " download_date TIMESTAMP DEFAULT CURRENT_TIMESTAMP, file_size INTEGER,"
                             " status TEXT DEFAULT 'completed');"
                             "INSERT INTO downloads (url, filename) VALUES ('https://h/r/old.zip', 'old.zip');",
                             nullptr, nullptr, nullptr) == SQLITE_OK);
        sqlite3_close(db);
    }

    Ledger ledger(file);
    CHECK(ledger.exists("https://h/r/old.zip", dir.str()));
    auto old = ledger.find("https://h/r/old.zip");
    REQUIRE(old);
    CHECK(old->full_path.empty());

    write_file(dir.path() / "new.bin", "abc");
    ledger.record("https://h/r/new.bin", "new.bin", dir.str());
    auto e = ledger.find("https://h/r/new.bin");
    REQUIRE(e);
    CHECK_FALSE(e->full_path.empty());
    ledger.close();

    // A second open finds every column present already.
    Ledger again(file);
    CHECK(again.exists("https://h/r/new.bin", dir.str()));
}

TEST_CASE("a url-only row from the oldest schema is not treated as downloaded") {
    TempDir dir;
    const std::string file = (dir.path() / "oldest.db").string();
    {
        sqlite3* db = nullptr;
        REQUIRE(sqlite3_open(file.c_str(), &db) == SQLITE_OK);
        REQUIRE(sqlite3_exec(db,
                             "CREATE TABLE downloads (url TEXT PRIMARY KEY);"
                             "INSERT INTO downloads (url) VALUES ('https://h/r/game.bin');",
                             nullptr, nullptr, nullptr) == SQLITE_OK);
        sqlite3_close(db);
    }

    Ledger ledger(file);
    CHECK_FALSE(ledger.exists("https://h/r/game.bin", dir.str()));
    auto e = ledger.find("https://h/r/game.bin");
    REQUIRE(e);
    CHECK(e->filename.empty());

    write_file(dir.path() / "game.bin", "rom");
    ledger.record("https://h/r/game.bin", "game.bin", dir.str());
    CHECK(ledger.exists("https://h/r/game.bin", dir.str()));
}

TEST_CASE("a directory at the recorded path does not count as the file") {
    TempDir dir;
    Ledger ledger((dir.path() / "ledger.db").string());
    ledger.record("https://h/r/disc.bin", "disc.bin", dir.str());
    fs::create_directories(dir.path() / "disc.bin");
    CHECK_FALSE(ledger.exists("https://h/r/disc.bin", dir.str()));
}

TEST_CASE("close is idempotent and later calls report an error") {
    TempDir dir;
    Ledger ledger((dir.path() / "ledger.db").string());
    ledger.close();
    ledger.close();
    CHECK_THROWS_AS(ledger.exists("https://h/r/x", dir.str()), LedgerError);
}

TEST_CASE("concurrent records from many threads all land") {
    TempDir dir;
    Ledger ledger((dir.path() / "ledger.db").string());
    constexpr int kThreads = 8;
    constexpr int kPerThread = 25;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                std::string name = "f" + std::to_string(t) + "_" + std::to_string(i) + ".zip";
                ledger.record("https://h/r/" + name, name, dir.str());
                ledger.exists("https://h/r/" + name, dir.str());
            }
        });
    }
    for (auto& th : threads) th.join();

    for (int t = 0; t < kThreads; ++t) {
        for (int i = 0; i < kPerThread; ++i) {
            std::string name = "f" + std::to_string(t) + "_" + std::to_string(i) + ".zip";
            CHECK(ledger.exists("https://h/r/" + name, dir.str()));
        }
    }
}
