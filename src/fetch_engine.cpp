#include "fetch_engine.hpp"

#include "errors.hpp"
#include "http_client.hpp"
#include "ledger.hpp"
#include "log.hpp"
#include "url_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <system_error>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

const char* to_string(FetchOutcome outcome) {
    switch (outcome) {
        case FetchOutcome::Downloaded: return "downloaded";
        case FetchOutcome::Skipped: return "skipped";
        case FetchOutcome::Failed: return "failed";
    }
    return "unknown";
}

// -------------------- ctor --------------------
FetchEngine::FetchEngine(HttpClient& client, Ledger& ledger, FetchOptions options, const std::atomic<bool>& stop)
    : client_(client),
      ledger_(ledger),
      options_(std::move(options)),
      stop_(stop) {
    options_.root_url = ensure_trailing_slash(options_.root_url);
    options_.max_threads = std::max(1, options_.max_threads);
    options_.max_attempts = std::max(1, options_.max_attempts);
    if (options_.chunk_size == 0) options_.chunk_size = 1024 * 1024;
}

// -------------------- helpers --------------------
void FetchEngine::backoff(std::chrono::seconds wait) const {
    if (options_.sleep) {
        options_.sleep(wait);
        return;
    }
    auto deadline = std::chrono::steady_clock::now() + wait;
    while (!stop_ && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

void FetchEngine::remove_partial(const std::string& localPath, const std::string& relPath) const {
    std::error_code ec;
    if (!fs::exists(localPath, ec)) return;
    fs::remove(localPath, ec);
    if (ec) log_warn("Could not remove partial file " + relPath + ": " + ec.message());
}

bool FetchEngine::transfer(const std::string& url, const std::string& localPath,
                           long long& bytes, std::string& error) {
    bytes = 0;
    // Opened on the first body chunk, so a refused request never touches
    // the destination.
    std::ofstream ofs;
    bool openFailed = false;
    auto open = [&]() {
        if (!ofs.is_open() && !openFailed) {
            ofs.open(localPath, std::ios::binary | std::ios::trunc);
            openFailed = !ofs.is_open();
        }
        return !openFailed;
    };

    // Bytes are written out in whole chunks as the buffer fills.
    std::vector<char> buffer;
    buffer.reserve(options_.chunk_size);
    auto flush = [&]() {
        if (buffer.empty() || !open()) return;
        ofs.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        bytes += static_cast<long long>(buffer.size());
        buffer.clear();
    };

    HttpResponse r = client_.download(url, [&](const char* data, size_t size) {
        if (stop_) return false;
        while (size > 0) {
            size_t take = std::min(size, options_.chunk_size - buffer.size());
            buffer.insert(buffer.end(), data, data + take);
            data += take;
            size -= take;
            if (buffer.size() == options_.chunk_size) flush();
        }
        return !openFailed && (!ofs.is_open() || static_cast<bool>(ofs));
    });

    if (openFailed) {
        error = "cannot open " + localPath + " for writing";
        return false;
    }
    if (!r.ok()) {
        error = stop_ ? "interrupted" : r.describe();
        return false;
    }
    flush();
    // empty bodies still produce a file
    if (!open()) {
        error = "cannot open " + localPath + " for writing";
        return false;
    }
    ofs.close();
    if (!ofs) {
        error = "write to " + localPath + " failed";
        return false;
    }
    return true;
}

// -------------------- per-URL --------------------
FetchResult FetchEngine::fetch_one(const std::string& url) {
    FetchResult result;
    result.url = url;

    const std::string rel = relative_path_for(url, options_.root_url);
    if (rel.empty()) {
        result.error = "no local path for URL";
        log_tagged("FAIL", url + " - " + result.error);
        return result;
    }

    try {
        if (ledger_.exists(url, options_.download_dir)) {
            log_tagged("SKIP", rel + " already downloaded.");
            result.relative_path = rel;
            result.outcome = FetchOutcome::Skipped;
            return result;
        }
    } catch (const LedgerError& e) {
        // Treated as not yet downloaded
        log_warn("Ledger lookup for " + rel + " failed: " + e.what());
    }

    const fs::path local = fs::path(options_.download_dir) / rel;
    std::error_code ec;
    if (local.has_parent_path()) fs::create_directories(local.parent_path(), ec);
    if (ec) {
        result.error = "cannot create " + local.parent_path().string() + ": " + ec.message();
        log_tagged("FAIL", rel + " - " + result.error);
        return result;
    }

    for (int attempt = 0; attempt < options_.max_attempts; ++attempt) {
        result.attempts = attempt + 1;
        std::string error;
        long long bytes = 0;
        bool ok = transfer(url, local.string(), bytes, error);
        if (ok) {
            try {
                ledger_.record(url, rel, options_.download_dir);
                log_tagged("OK", "  " + rel);
                result.relative_path = rel;
                result.outcome = FetchOutcome::Downloaded;
                result.bytes = bytes;
                result.error.clear();
                return result;
            } catch (const LedgerError& e) {
                error = e.what();
            }
        }
        result.error = error;

        const bool last = attempt + 1 >= options_.max_attempts || stop_;
        if (!last) {
            auto wait = std::chrono::seconds(1LL << attempt);
            log_tagged("RETRY", rel + " - attempt " + std::to_string(attempt + 1) + "/" +
                                std::to_string(options_.max_attempts) + " failed: " + error +
                                ", retrying in " + std::to_string(wait.count()) + "s...");
            backoff(wait);
            if (!stop_) continue;
        }
        log_tagged("FAIL", rel + " - " + error);
        remove_partial(local.string(), rel);
        break;
    }
    return result;
}

// -------------------- workers --------------------
void FetchEngine::worker(const ResultHandler& onResult) {
    for (;;) {
        std::string url;
        {
            std::lock_guard<std::mutex> lk(queue_mtx_);
            if (queue_.empty() || stop_) break;
            url = std::move(queue_.front());
            queue_.pop_front();
        }

        FetchResult result = fetch_one(url);
        if (onResult) onResult(result);
        {
            std::lock_guard<std::mutex> lk(results_mtx_);
            results_.push_back(std::move(result));
        }
    }
}

std::vector<FetchResult> FetchEngine::fetch_all(const std::set<std::string>& leafUrls,
                                                const ResultHandler& onResult) {
    {
        std::lock_guard<std::mutex> lk(results_mtx_);
        results_.clear();
        results_.reserve(leafUrls.size());
    }

    // Sanitizing can map distinct URLs onto one local file; the first URL
    // in order keeps the path and the others fail without being fetched.
    std::map<std::string, std::string> claimed;
    std::deque<std::string> work;
    for (const auto& url : leafUrls) {
        const std::string rel = relative_path_for(url, options_.root_url);
        auto owner = rel.empty() ? claimed.end() : claimed.find(rel);
        if (owner == claimed.end()) {
            if (!rel.empty()) claimed.emplace(rel, url);
            work.push_back(url);
            continue;
        }
        FetchResult collision;
        collision.url = url;
        collision.error = "local path " + rel + " already taken by " + owner->second;
        log_tagged("FAIL", url + " - " + collision.error);
        if (onResult) onResult(collision);
        std::lock_guard<std::mutex> lk(results_mtx_);
        results_.push_back(std::move(collision));
    }
    {
        std::lock_guard<std::mutex> lk(queue_mtx_);
        queue_ = std::move(work);
    }

    std::vector<std::thread> workers;
    workers.reserve(options_.max_threads);
    for (int i = 0; i < options_.max_threads; ++i) {
        workers.emplace_back(&FetchEngine::worker, this, std::cref(onResult));
    }
    for (auto& t : workers) t.join();

    std::lock_guard<std::mutex> lk(results_mtx_);
    return std::move(results_);
}
