#pragma once

#include "http_client.hpp"

#include <minizip/zip.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <map>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

// Unique scratch directory, removed on scope exit.
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "dirmirror-test-") {
        auto base = fs::temp_directory_path();
        std::random_device rd;
        std::mt19937_64 gen(rd());
        std::uniform_int_distribution<unsigned long long> dist;
        for (int i = 0; i < 5; ++i) {
            path_ = base / (prefix + std::to_string(dist(gen)));
            if (!fs::exists(path_)) break;
        }
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    fs::path path_;
};

inline std::string read_file(const fs::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

inline void write_file(const fs::path& p, const std::string& content) {
    if (p.has_parent_path()) fs::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
    ofs << content;
}

// Stored (uncompressed) or deflated entries written with minizip.
inline bool make_zip(const fs::path& p, const std::vector<std::pair<std::string, std::string>>& entries) {
    zipFile zf = zipOpen64(p.string().c_str(), APPEND_STATUS_CREATE);
    if (!zf) return false;
    bool ok = true;
    for (const auto& e : entries) {
        zip_fileinfo info{};
        if (zipOpenNewFileInZip64(zf, e.first.c_str(), &info, nullptr, 0, nullptr, 0, nullptr,
                                  Z_DEFLATED, Z_DEFAULT_COMPRESSION, 0) != ZIP_OK) {
            ok = false;
            break;
        }
        if (!e.second.empty() &&
            zipWriteInFileInZip(zf, e.second.data(), static_cast<unsigned>(e.second.size())) != ZIP_OK) {
            ok = false;
        }
        zipCloseFileInZip(zf);
    }
    zipClose(zf, nullptr);
    return ok;
}

// Apache-style autoindex page linking each of `hrefs`.
inline std::string listing_page(std::initializer_list<std::string> hrefs) {
    std::string html = "<html><body><h1>Index</h1><pre>\n<a href=\"../\">Parent Directory</a>\n";
    for (const auto& h : hrefs) html += "<a href=\"" + h + "\">" + h + "</a>\n";
    return html + "</pre></body></html>\n";
}

// In-memory server. Listing pages and files are keyed by exact URL; a file
// can be told to fail its first N downloads after sending half its body.
class FakeHttpClient : public HttpClient {
public:
    void add_page(const std::string& url, const std::string& body) {
        std::lock_guard<std::mutex> lk(mtx_);
        pages_[url] = body;
    }
    void add_file(const std::string& url, const std::string& content, int failures = 0) {
        std::lock_guard<std::mutex> lk(mtx_);
        files_[url] = content;
        failures_[url] = failures;
    }
    void add_status(const std::string& url, long status) {
        std::lock_guard<std::mutex> lk(mtx_);
        statuses_[url] = status;
    }

    HttpResponse get_text(const std::string& url) override {
        std::lock_guard<std::mutex> lk(mtx_);
        ++pageGets_[url];
        HttpResponse r;
        auto it = pages_.find(url);
        if (it == pages_.end()) {
            r.status = 404;
            return r;
        }
        r.status = 200;
        r.body = it->second;
        return r;
    }

    HttpResponse download(const std::string& url, const ChunkSink& sink) override {
        std::string content;
        bool fail = false;
        long status = 200;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            ++downloads_[url];
            ++totalDownloads_;
            auto st = statuses_.find(url);
            if (st != statuses_.end()) status = st->second;
            auto it = files_.find(url);
            if (it == files_.end()) status = 404;
            else content = it->second;
            auto f = failures_.find(url);
            if (f != failures_.end() && f->second > 0) {
                --f->second;
                fail = true;
            }
        }

        HttpResponse r;
        r.status = status;
        if (status != 200) return r;
        const size_t half = fail ? content.size() / 2 : content.size();
        // deliver in small pieces so chunk buffering is exercised
        for (size_t off = 0; off < half; off += 7) {
            size_t n = std::min<size_t>(7, half - off);
            if (!sink(content.data() + off, n)) {
                r.error = "aborted by callback";
                return r;
            }
        }
        if (fail) r.error = "connection reset by peer";
        return r;
    }

    int downloads(const std::string& url) const {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = downloads_.find(url);
        return it == downloads_.end() ? 0 : it->second;
    }
    int total_downloads() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return totalDownloads_;
    }
    int page_gets(const std::string& url) const {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = pageGets_.find(url);
        return it == pageGets_.end() ? 0 : it->second;
    }

private:
    mutable std::mutex mtx_;
    std::map<std::string, std::string> pages_;
    std::map<std::string, std::string> files_;
    std::map<std::string, int> failures_;
    std::map<std::string, long> statuses_;
    std::map<std::string, int> downloads_;
    std::map<std::string, int> pageGets_;
    int totalDownloads_ = 0;
};
