#pragma once

#include <string>
#include <vector>

// Every <a ... href="..."> value on the page, in document order.
// Tag and attribute names match case-insensitively; &amp; is decoded.
std::vector<std::string> extract_hrefs(const std::string& html);

// True when the href names a sub-directory listing.
bool is_directory_href(const std::string& href);
