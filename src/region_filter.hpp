#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

// Maps short region codes (EU, JP, ...) to the names used in release tags.
// Matching is on the upper-cased token; unknown tokens pass through.
std::vector<std::string> resolve_region_aliases(const std::vector<std::string>& raw);

// First parenthesized group of a filename, lower-cased.
std::optional<std::string> region_tag(const std::string& filename);

bool matches_region(const std::string& filename, const std::vector<std::string>& regions);

// Keeps leaf URLs whose decoded filename region tag contains any of
// `regions`. Identity when `regions` is empty.
std::set<std::string> filter_by_region(const std::set<std::string>& leafUrls,
                                       const std::vector<std::string>& regions);
