#include "pipeline.hpp"

#include "archive_extractor.hpp"
#include "http_client.hpp"
#include "ledger.hpp"
#include "log.hpp"
#include "region_filter.hpp"
#include "run_report.hpp"
#include "tree_walker.hpp"
#include "url_utils.hpp"

#include <filesystem>
#include <mutex>
#include <ostream>
#include <system_error>

namespace fs = std::filesystem;

Pipeline::Pipeline(Config config, HttpClient& client, const std::atomic<bool>& stop)
    : config_(std::move(config)),
      client_(client),
      stop_(stop) {
    config_.base_url = ensure_trailing_slash(config_.base_url);
}

std::string Pipeline::describe_regions() const {
    std::string s = "[";
    for (size_t i = 0; i < config_.regions.size(); ++i) {
        if (i) s += ", ";
        s += config_.regions[i];
    }
    return s + "]";
}

int Pipeline::run(std::ostream& out) {
    log_info("Fetching file list from " + config_.base_url + " ...");
    TreeWalker walker(client_, stop_);
    std::set<std::string> files = walker.walk(config_.base_url);
    log_info("Found " + std::to_string(files.size()) + " files.");

    if (!config_.regions.empty()) {
        size_t total = files.size();
        files = filter_by_region(files, config_.regions);
        log_info("Region filter " + describe_regions() + ": " + std::to_string(files.size()) + "/" +
                 std::to_string(total) + " files matched.");
    }

    if (config_.count_only) {
        out << files.size() << std::endl;
        return 0;
    }

    Ledger ledger(config_.db_file);

    FetchOptions options;
    options.root_url = config_.base_url;
    options.download_dir = config_.download_dir;
    options.max_threads = config_.max_threads;
    options.sleep = sleep_;
    FetchEngine engine(client_, ledger, options, stop_);

    const size_t total = files.size();
    size_t completed = 0;
    std::mutex progress_mtx;
    log_info("Starting download of " + std::to_string(total) + " files with " +
             std::to_string(config_.max_threads) + " threads...");

    results_ = engine.fetch_all(files, [&](const FetchResult& r) {
        {
            std::lock_guard<std::mutex> lk(progress_mtx);
            ++completed;
            if (completed % kProgressEvery == 0 || completed == total) {
                log_info("Progress: " + std::to_string(completed) + "/" + std::to_string(total) +
                         " files processed.");
            }
        }
        if (!r.succeeded() || !is_archive_name(*r.relative_path)) return;
        const fs::path archive = fs::path(config_.download_dir) / *r.relative_path;
        std::error_code ec;
        if (fs::exists(archive, ec)) extract_archive(archive.string());
    });

    if (!config_.manifest_file.empty()) write_run_report(config_.manifest_file, results_);
    ledger.close();

    if (stop_) {
        log_warn("Interrupted: " + std::to_string(results_.size()) + "/" + std::to_string(total) +
                 " files processed.");
    } else {
        log_tagged("DONE", "All downloads completed.");
    }
    return 0;
}
