#pragma once

#include <string>

// Tagged, line-oriented output shared by all worker threads.
// Each call writes exactly one line; lines never interleave.
void log_info(const std::string& msg);
void log_tagged(const std::string& tag, const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);
