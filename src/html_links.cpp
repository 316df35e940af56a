#include "html_links.hpp"

#include <regex>
#include <utility>

namespace {
std::string decode_entities(std::string s) {
    static const std::pair<const char*, const char*> entities[] = {
        {"&amp;", "&"}, {"&quot;", "\""}, {"&#39;", "'"}, {"&lt;", "<"}, {"&gt;", ">"},
    };
    for (const auto& e : entities) {
        const std::string from = e.first;
        size_t pos = 0;
        while ((pos = s.find(from, pos)) != std::string::npos) {
            s.replace(pos, from.size(), e.second);
            pos += 1;
        }
    }
    return s;
}
} // namespace

std::vector<std::string> extract_hrefs(const std::string& html) {
    std::vector<std::string> links;
    static const std::regex a_href_re(R"xxx(<\s*a\b[^>]*?\bhref\s*=\s*(?:"([^"]*)"|'([^']*)'|([^\s>"']+)))xxx",
                                      std::regex::icase);
    for (std::sregex_iterator it(html.begin(), html.end(), a_href_re), end; it != end; ++it) {
        std::string link;
        if ((*it)[1].matched) link = (*it)[1].str();
        else if ((*it)[2].matched) link = (*it)[2].str();
        else link = (*it)[3].str();
        if (link.empty()) continue;
        links.push_back(decode_entities(link));
    }
    return links;
}

bool is_directory_href(const std::string& href) {
    return !href.empty() && href.back() == '/';
}
