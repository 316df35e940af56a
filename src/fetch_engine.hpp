#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

class HttpClient;
class Ledger;

enum class FetchOutcome { Downloaded, Skipped, Failed };

const char* to_string(FetchOutcome outcome);

struct FetchResult {
    std::string url;
    std::optional<std::string> relative_path;  // unset on failure
    FetchOutcome outcome = FetchOutcome::Failed;
    int attempts = 0;
    long long bytes = 0;
    std::string error;

    bool succeeded() const { return outcome != FetchOutcome::Failed; }
};

struct FetchOptions {
    std::string root_url;
    std::string download_dir;
    int max_threads = 8;
    int max_attempts = 3;
    size_t chunk_size = 1024 * 1024;
    // Backoff wait between attempts; defaults to a sleep that returns early
    // once stop is requested.
    std::function<void(std::chrono::seconds)> sleep;
};

// Downloads leaf URLs with a fixed pool of worker threads. A URL already in
// the ledger is skipped; otherwise it is retried with exponential backoff
// and recorded only after its file is completely written.
class FetchEngine {
public:
    using ResultHandler = std::function<void(const FetchResult&)>;

    FetchEngine(HttpClient& client, Ledger& ledger, FetchOptions options, const std::atomic<bool>& stop);

    // Runs exactly options.max_threads workers over `leafUrls`. `onResult`
    // is called from the worker thread as soon as each URL finishes.
    std::vector<FetchResult> fetch_all(const std::set<std::string>& leafUrls,
                                       const ResultHandler& onResult = {});

    FetchResult fetch_one(const std::string& url);

private:
    bool transfer(const std::string& url, const std::string& localPath, long long& bytes, std::string& error);
    void remove_partial(const std::string& localPath, const std::string& relPath) const;
    void backoff(std::chrono::seconds wait) const;
    void worker(const ResultHandler& onResult);

    HttpClient& client_;
    Ledger& ledger_;
    FetchOptions options_;
    const std::atomic<bool>& stop_;

    std::deque<std::string> queue_;
    std::mutex queue_mtx_;
    std::vector<FetchResult> results_;
    std::mutex results_mtx_;
};
