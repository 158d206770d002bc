#include "cli_options.hpp"
#include "crawler_utils.hpp"
#include "reader_exception.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace eshia {

// Helper: Remove "--name value" / "--name=value" / short form and return the value
static bool TakeOption(std::vector<std::string> &args, const std::string &long_name,
                       const std::string &short_name, std::string &out_value) {
	for (size_t i = 0; i < args.size(); i++) {
		if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
			if (i + 1 >= args.size()) {
				throw ArgumentException("missing value for " + long_name);
			}
			out_value = args[i + 1];
			args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
			return true;
		}
		const std::string prefix = long_name + "=";
		if (args[i].compare(0, prefix.size(), prefix) == 0) {
			out_value = args[i].substr(prefix.size());
			if (out_value.empty()) {
				throw ArgumentException("missing value for " + long_name);
			}
			args.erase(args.begin() + static_cast<long>(i));
			return true;
		}
	}
	return false;
}

static bool TakeFlag(std::vector<std::string> &args, const std::string &name) {
	for (size_t i = 0; i < args.size(); i++) {
		if (args[i] == name) {
			args.erase(args.begin() + static_cast<long>(i));
			return true;
		}
	}
	return false;
}

static int64_t ParseInteger(const std::string &option, const std::string &value) {
	errno = 0;
	char *end = nullptr;
	long long parsed = std::strtoll(value.c_str(), &end, 10);
	if (value.empty() || *end != '\0' || errno == ERANGE) {
		throw ArgumentException(option + " expects an integer, got: " + value);
	}
	return static_cast<int64_t>(parsed);
}

static double ParseSeconds(const std::string &option, const std::string &value) {
	errno = 0;
	char *end = nullptr;
	double parsed = std::strtod(value.c_str(), &end);
	if (value.empty() || *end != '\0' || errno == ERANGE || !std::isfinite(parsed)) {
		throw ArgumentException(option + " expects a number of seconds, got: " + value);
	}
	return parsed;
}

std::string CliUsage(const std::string &program) {
	std::ostringstream out;
	out << "usage: " << program << " <start_url> [options]\n"
	    << "\n"
	    << "Extract full reader text from lib.eshia.ir book pages and follow\n"
	    << "internal page links automatically.\n"
	    << "\n"
	    << "  start_url             e.g. https://lib.eshia.ir/15050/1/0\n"
	    << "  -o, --output PATH     output UTF-8 text file (default: book_text.txt)\n"
	    << "  --max-pages N         safety cap for total pages to fetch (default: 10000)\n"
	    << "  --delay SEC           delay between page requests (default: 0)\n"
	    << "  --timeout SEC         HTTP timeout per request (default: 30)\n"
	    << "  --retries N           attempts per page on request failure (default: 3)\n"
	    << "  --quiet               disable progress output on stderr\n"
	    << "  -h, --help            show this help\n";
	return out.str();
}

CliOptions ParseCliOptions(std::vector<std::string> args) {
	CliOptions options;

	if (TakeFlag(args, "--help") || TakeFlag(args, "-h")) {
		options.show_help = true;
		return options;
	}

	options.quiet = TakeFlag(args, "--quiet");

	std::string value;
	if (TakeOption(args, "--output", "-o", value)) {
		options.output_path = value;
	}
	if (TakeOption(args, "--max-pages", "", value)) {
		options.crawl.max_pages = ParseInteger("--max-pages", value);
	}
	if (TakeOption(args, "--delay", "", value)) {
		options.crawl.delay_seconds = ParseSeconds("--delay", value);
	}
	if (TakeOption(args, "--timeout", "", value)) {
		options.crawl.timeout_seconds = ParseSeconds("--timeout", value);
	}
	if (TakeOption(args, "--retries", "", value)) {
		int64_t retries = ParseInteger("--retries", value);
		if (retries > 1000) {
			throw ArgumentException("--retries must be <= 1000");
		}
		options.crawl.retries = static_cast<int>(retries < 0 ? 0 : retries);
	}

	// Whatever is left must be exactly one positional start URL
	for (const auto &arg : args) {
		if (arg.size() > 1 && arg[0] == '-') {
			throw ArgumentException("unknown option: " + arg);
		}
	}
	if (args.empty()) {
		throw ArgumentException("missing start URL");
	}
	if (args.size() > 1) {
		throw ArgumentException("unexpected argument: " + args[1]);
	}
	options.start_url = args[0];

	if (options.crawl.max_pages < 1) {
		throw ArgumentException("--max-pages must be >= 1");
	}
	if (options.crawl.retries < 1) {
		throw ArgumentException("--retries must be >= 1");
	}
	if (!(options.crawl.timeout_seconds > 0)) {
		throw ArgumentException("--timeout must be > 0");
	}
	if (!(options.crawl.delay_seconds >= 0)) {
		throw ArgumentException("--delay must be >= 0");
	}

	std::string url_error = GetUrlValidationError(options.start_url);
	if (!url_error.empty()) {
		throw ArgumentException(url_error);
	}

	return options;
}

} // namespace eshia
