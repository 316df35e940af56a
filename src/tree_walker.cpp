#include "tree_walker.hpp"

#include "html_links.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "url_utils.hpp"

#include <deque>
#include <unordered_set>

TreeWalker::TreeWalker(HttpClient& client, const std::atomic<bool>& stop)
    : client_(client),
      stop_(stop) {}

bool TreeWalker::is_skipped_href(const std::string& href) {
    // parent/self links and index pages
    static const char* markers[] = {"../", "./", "..", ".", "/", "index.html", "index.htm"};
    if (href.empty() || href[0] == '#') return true;
    for (const char* m : markers) {
        if (href == m) return true;
    }
    return href.find('?') != std::string::npos;
}

std::set<std::string> TreeWalker::walk(const std::string& rootUrl) {
    const std::string root = ensure_trailing_slash(rootUrl);
    std::set<std::string> leaves;
    std::deque<std::string> queue{root};
    std::unordered_set<std::string> visited{root};
    pagesScanned_ = 0;

    while (!queue.empty()) {
        if (stop_) {
            log_warn("Stop requested, directory scan interrupted with " +
                     std::to_string(queue.size()) + " listings unvisited.");
            break;
        }
        std::string url = std::move(queue.front());
        queue.pop_front();

        log_info("Scanning directory: " + url);
        HttpResponse page = client_.get_text(url);
        ++pagesScanned_;
        if (!page.ok()) {
            log_error("Failed to list " + url + ": " + page.describe());
            continue;
        }

        for (const auto& href : extract_hrefs(page.body)) {
            if (is_skipped_href(href)) continue;
            auto full = resolve_url(url, href);
            if (!full) continue;
            // Only descend within the root
            if (!starts_with(*full, root) || *full == root) continue;

            if (is_directory_href(*full)) {
                if (visited.insert(*full).second) queue.push_back(*full);
            } else {
                leaves.insert(*full);
            }
        }
    }
    return leaves;
}
