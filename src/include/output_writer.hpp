#pragma once

#include "book_crawler.hpp"
#include <string>
#include <vector>

namespace eshia {

// Line placed between consecutive pages in the output file
extern const char *PAGE_SEPARATOR;

// Page texts in visit order joined by "\n" PAGE_SEPARATOR "\n"
std::string JoinPages(const std::vector<CrawledPage> &pages);

// Write the joined text as UTF-8 with LF line endings. Data goes to
// "<path>.tmp" first and is renamed over path, so a failed write never
// leaves a truncated file. Throws OutputException.
void WriteBookText(const std::string &path, const std::vector<CrawledPage> &pages);

} // namespace eshia
