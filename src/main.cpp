// eshia_reader command line front end
//
// Usage:
//   eshia_reader https://lib.eshia.ir/15050/1/0 -o book.txt --delay 0.5
//
// Exit codes: 0 success, 1 crawl or write failure, 2 invalid arguments

#include "book_crawler.hpp"
#include "cli_options.hpp"
#include "http_client.hpp"
#include "output_writer.hpp"
#include "page_fetcher.hpp"
#include "reader_exception.hpp"

#include <cstdio>
#include <exception>
#include <string>
#include <vector>

using namespace eshia;

static void PrintProgressBar(const CrawlProgress &progress) {
	const int width = 30;
	int64_t total = progress.DisplayTotal();
	double ratio = static_cast<double>(progress.processed) / static_cast<double>(total);
	if (ratio > 1.0) {
		ratio = 1.0;
	}
	int filled = static_cast<int>(width * ratio);

	std::string bar(static_cast<size_t>(filled), '#');
	bar.append(static_cast<size_t>(width - filled), '-');

	fprintf(stderr, "\r[%s] %6.2f%% %lld/%lld pages | volume %lld page %lld", bar.c_str(), ratio * 100.0,
	        static_cast<long long>(progress.processed), static_cast<long long>(total),
	        static_cast<long long>(progress.current.volume), static_cast<long long>(progress.current.page));
	fflush(stderr);
}

int main(int argc, char **argv) {
	std::string program = argc > 0 ? argv[0] : "eshia_reader";
	std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

	CliOptions options;
	try {
		options = ParseCliOptions(args);
	} catch (const ArgumentException &e) {
		fprintf(stderr, "%s\n\n%s", e.what(), CliUsage(program).c_str());
		return 2;
	}
	if (options.show_help) {
		printf("%s", CliUsage(program).c_str());
		return 0;
	}

	InitializeHttpClient();
	int exit_code = 0;
	try {
		CurlPageFetcher fetcher;
		BookCrawler crawler(fetcher, options.crawl);
		if (!options.quiet) {
			crawler.SetProgressCallback(PrintProgressBar);
		}

		CrawlResult result;
		try {
			result = crawler.Run(options.start_url);
		} catch (...) {
			if (!options.quiet) {
				fprintf(stderr, "\n");
			}
			throw;
		}

		if (!options.quiet) {
			fprintf(stderr, "\n");
			if (result.stop_reason == CrawlStopReason::MAX_PAGES_REACHED) {
				fprintf(stderr, "Stopped at --max-pages (%lld).\n", static_cast<long long>(options.crawl.max_pages));
			}
		}

		WriteBookText(options.output_path, result.pages);

		printf("Done. Pages extracted: %zu\n", result.pages.size());
		printf("Output file: %s\n", options.output_path.c_str());
	} catch (const std::exception &e) {
		fprintf(stderr, "Error: %s\n", e.what());
		exit_code = 1;
	}
	CleanupHttpClient();

	return exit_code;
}
