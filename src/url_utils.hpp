#pragma once

#include <optional>
#include <string>

struct UrlParts {
    std::string scheme;
    std::string host;
    std::string path;
};

std::string to_lower(const std::string& s);
bool starts_with(const std::string& s, const std::string& pre);
bool ends_with(const std::string& s, const std::string& suf);
bool ends_with_ci(const std::string& s, const std::string& suf);

std::optional<UrlParts> parse_url(const std::string& url);
bool is_absolute_url(const std::string& url);

// Resolves `link` against the page at `base_url`. Handles absolute,
// scheme-relative, host-absolute and relative references and removes
// "." / ".." segments. The fragment is dropped; a query is kept.
std::optional<std::string> resolve_url(const std::string& base_url, const std::string& link);

// Appends a trailing '/' if missing.
std::string ensure_trailing_slash(const std::string& url);

// %XX decoding; malformed escapes are kept literally, '+' is not a space.
std::string percent_decode(const std::string& s);

// Last path segment of a URL (after the final '/'), still encoded.
std::string last_segment(const std::string& url);

std::string sanitize_filename(const std::string& name);

// Local path of `url` relative to `root_url`: prefix stripped, decoded,
// separators normalized to '/', empty/"."/".." segments dropped, unsafe
// characters replaced. Empty when nothing is left.
std::string relative_path_for(const std::string& url, const std::string& root_url);
