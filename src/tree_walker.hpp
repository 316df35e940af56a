#pragma once

#include <atomic>
#include <set>
#include <string>

class HttpClient;

// Breadth-first walk over nested directory-listing pages. Single-threaded;
// a listing that fails to load is logged and its subtree skipped.
class TreeWalker {
public:
    TreeWalker(HttpClient& client, const std::atomic<bool>& stop);

    // Absolute URLs of every leaf file under `rootUrl`.
    std::set<std::string> walk(const std::string& rootUrl);

    // Listing pages fetched by the last walk().
    size_t pages_scanned() const { return pagesScanned_; }

private:
    static bool is_skipped_href(const std::string& href);

    HttpClient& client_;
    const std::atomic<bool>& stop_;
    size_t pagesScanned_ = 0;
};
