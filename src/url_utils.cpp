#include "url_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <vector>

// -------------------- small utils --------------------
std::string to_lower(const std::string& s) {
    std::string r = s;
    for (auto& ch : r) ch = static_cast<char>(::tolower(static_cast<unsigned char>(ch)));
    return r;
}

bool starts_with(const std::string& s, const std::string& pre) {
    return s.rfind(pre, 0) == 0;
}

bool ends_with(const std::string& s, const std::string& suf) {
    if (s.size() < suf.size()) return false;
    return std::equal(s.end() - suf.size(), s.end(), suf.begin());
}

bool ends_with_ci(const std::string& s, const std::string& suf) {
    return ends_with(to_lower(s), to_lower(suf));
}

// -------------------- parsing --------------------
std::optional<UrlParts> parse_url(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*):\/\/([^\/?#]+)([^#]*)?(#.*)?$)");
    std::smatch m;
    if (std::regex_match(url, m, re)) {
        UrlParts p;
        p.scheme = m[1].str();
        p.host = m[2].str();
        p.path = m[3].matched ? m[3].str() : "/";
        if (p.path.empty() || p.path[0] != '/') p.path = "/" + p.path;
        return p;
    }
    return std::nullopt;
}

bool is_absolute_url(const std::string& url) {
    static const std::regex re(R"(^[a-zA-Z][a-zA-Z0-9+.-]*:)");
    return std::regex_search(url, re);
}

namespace {
// Collapses "." and ".." in a path that starts with '/'. The query, if any,
// must already be split off.
std::string remove_dot_segments(const std::string& path) {
    std::vector<std::string> out;
    std::string seg;
    std::istringstream iss(path);
    bool trailing_dir = ends_with(path, "/") || ends_with(path, "/.") || ends_with(path, "/..");
    while (std::getline(iss, seg, '/')) {
        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            if (!out.empty()) out.pop_back();
            continue;
        }
        out.push_back(seg);
    }
    std::string r;
    for (const auto& s : out) r += "/" + s;
    if (r.empty() || trailing_dir) r += "/";
    return r;
}

std::string dirname_path(const std::string& path) {
    auto pos = path.rfind('/');
    if (pos == std::string::npos) return "/";
    return path.substr(0, pos + 1);
}
} // namespace

std::optional<std::string> resolve_url(const std::string& base_url, const std::string& link) {
    auto hash = link.find('#');
    std::string ref = hash == std::string::npos ? link : link.substr(0, hash);

    auto base = parse_url(base_url);
    if (!base) return std::nullopt;

    std::string scheme = base->scheme;
    std::string host = base->host;
    std::string target;

    if (is_absolute_url(ref)) {
        auto p = parse_url(ref);
        if (!p) return std::nullopt;
        scheme = p->scheme;
        host = p->host;
        target = p->path;
    } else if (ref.size() > 1 && ref[0] == '/' && ref[1] == '/') {
        // protocol-relative
        auto p = parse_url(scheme + ":" + ref);
        if (!p) return std::nullopt;
        host = p->host;
        target = p->path;
    } else if (!ref.empty() && ref[0] == '/') {
        target = ref;
    } else {
        std::string base_path = base->path;
        auto q = base_path.find('?');
        if (q != std::string::npos) base_path = base_path.substr(0, q);
        if (ref.empty()) return scheme + "://" + host + base->path;
        if (ref[0] == '?') return scheme + "://" + host + base_path + ref;
        target = dirname_path(base_path) + ref;
    }

    std::string query;
    auto q = target.find('?');
    if (q != std::string::npos) {
        query = target.substr(q);
        target = target.substr(0, q);
    }
    return scheme + "://" + host + remove_dot_segments(target) + query;
}

std::string ensure_trailing_slash(const std::string& url) {
    if (ends_with(url, "/")) return url;
    return url + "/";
}

// -------------------- path/filename helpers --------------------
std::string percent_decode(const std::string& s) {
    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex(s[i + 1]);
            int lo = hex(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

std::string last_segment(const std::string& url) {
    std::string u = url;
    auto cut = u.find_first_of("?#");
    if (cut != std::string::npos) u = u.substr(0, cut);
    auto slash = u.find_last_of('/');
    return slash == std::string::npos ? u : u.substr(slash + 1);
}

std::string sanitize_filename(const std::string& name) {
    std::string s = name;
    for (char& c : s) {
        if (c == ':' || c == '*' || c == '?' || c == '"' || c == '<' || c == '>' || c == '|' ||
            static_cast<unsigned char>(c) < 0x20) c = '_';
    }
    return s;
}

std::string relative_path_for(const std::string& url, const std::string& root_url) {
    std::string rel = starts_with(url, root_url) ? url.substr(root_url.size()) : url;
    rel = percent_decode(rel);
    std::replace(rel.begin(), rel.end(), '\\', '/');

    std::string out;
    std::string seg;
    std::istringstream iss(rel);
    while (std::getline(iss, seg, '/')) {
        if (seg.empty() || seg == "." || seg == "..") continue;
        if (!out.empty()) out += '/';
        out += sanitize_filename(seg);
    }
    return out;
}
