#include "region_filter.hpp"

#include "url_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <unordered_map>

std::vector<std::string> resolve_region_aliases(const std::vector<std::string>& raw) {
    static const std::unordered_map<std::string, std::string> aliases = {
        {"EU", "Europe"}, {"JP", "Japan"}, {"JPN", "Japan"},
        {"AUS", "Australia"}, {"KR", "Korea"}, {"BR", "Brazil"},
        {"CN", "China"}, {"FR", "France"}, {"DE", "Germany"},
        {"HK", "Hong Kong"}, {"IT", "Italy"}, {"NL", "Netherlands"},
        {"ES", "Spain"}, {"SE", "Sweden"}, {"CA", "Canada"},
    };
    std::vector<std::string> out;
    out.reserve(raw.size());
    for (const auto& r : raw) {
        std::string upper = r;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        auto it = aliases.find(upper);
        out.push_back(it == aliases.end() ? r : it->second);
    }
    return out;
}

std::optional<std::string> region_tag(const std::string& filename) {
    static const std::regex group_re(R"(\(([^)]+)\))");
    std::smatch m;
    if (!std::regex_search(filename, m, group_re)) return std::nullopt;
    return to_lower(m[1].str());
}

bool matches_region(const std::string& filename, const std::vector<std::string>& regions) {
    auto tag = region_tag(filename);
    if (!tag) return false;
    return std::any_of(regions.begin(), regions.end(), [&](const std::string& r) {
        return tag->find(to_lower(r)) != std::string::npos;
    });
}

std::set<std::string> filter_by_region(const std::set<std::string>& leafUrls,
                                       const std::vector<std::string>& regions) {
    if (regions.empty()) return leafUrls;
    std::set<std::string> kept;
    for (const auto& url : leafUrls) {
        if (matches_region(percent_decode(last_segment(url)), regions)) kept.insert(url);
    }
    return kept;
}
