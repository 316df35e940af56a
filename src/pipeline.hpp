#pragma once

#include "config.hpp"
#include "fetch_engine.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

class HttpClient;

// Walk -> region filter -> fetch -> unzip, for one configured root.
class Pipeline {
public:
    Pipeline(Config config, HttpClient& client, const std::atomic<bool>& stop);

    // Replaces the backoff wait used between download attempts.
    void set_backoff(std::function<void(std::chrono::seconds)> sleep) { sleep_ = std::move(sleep); }

    // Returns the process exit code. Count mode prints the number of
    // matching files to `out` and touches neither disk nor ledger.
    int run(std::ostream& out);

    const std::vector<FetchResult>& results() const { return results_; }

private:
    static constexpr size_t kProgressEvery = 50;

    std::string describe_regions() const;

    Config config_;
    HttpClient& client_;
    const std::atomic<bool>& stop_;
    std::function<void(std::chrono::seconds)> sleep_;
    std::vector<FetchResult> results_;
};
