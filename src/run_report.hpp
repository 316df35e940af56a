#pragma once

#include "fetch_engine.hpp"

#include <string>
#include <vector>

// Writes one JSON object per result to `filepath`. Returns false (after
// logging) when the file cannot be written.
bool write_run_report(const std::string& filepath, const std::vector<FetchResult>& results);
