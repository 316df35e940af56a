#include "run_report.hpp"

#include "log.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

using nlohmann::json;

bool write_run_report(const std::string& filepath, const std::vector<FetchResult>& results) {
    json j = json::array();
    for (const auto& r : results) {
        j.push_back({
            {"url", r.url},
            {"path", r.relative_path ? json(*r.relative_path) : json(nullptr)},
            {"outcome", to_string(r.outcome)},
            {"attempts", r.attempts},
            {"bytes", r.bytes},
            {"error", r.error}
        });
    }
    std::ofstream ofs(filepath);
    ofs << j.dump(2);
    ofs.close();
    if (!ofs) {
        log_error("Could not write run report " + filepath);
        return false;
    }
    log_info("Run report written: " + filepath + ", items: " + std::to_string(results.size()));
    return true;
}
