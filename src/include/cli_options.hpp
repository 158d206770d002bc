#pragma once

#include "book_crawler.hpp"
#include <string>
#include <vector>

namespace eshia {

struct CliOptions {
	std::string start_url;
	std::string output_path = "book_text.txt";
	CrawlOptions crawl;
	bool quiet = false;
	bool show_help = false;
};

// Parse arguments (without the program name). Throws ArgumentException for
// unknown options, missing or malformed values, out-of-range numbers and a
// start URL that is not a reader page URL.
CliOptions ParseCliOptions(std::vector<std::string> args);

std::string CliUsage(const std::string &program);

} // namespace eshia
