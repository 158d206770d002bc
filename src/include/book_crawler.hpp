#pragma once

#include "page_fetcher.hpp"
#include "page_ref.hpp"
#include <cstdint>
#include <functional>
#include <utility>
#include <string>
#include <vector>

namespace eshia {

struct CrawlOptions {
	int64_t max_pages = 10000;     // Safety cap on fetched pages
	double delay_seconds = 0.0;    // Pause between page requests
	double timeout_seconds = 30.0; // Per request
	int retries = 3;               // Attempts per page
};

// Throws ArgumentException naming the first invalid field
void ValidateCrawlOptions(const CrawlOptions &options);

struct CrawledPage {
	PageRef ref;
	std::string url;
	std::string text;
};

enum class CrawlStopReason : uint8_t {
	END_OF_DOCUMENT = 0,   // Last page has no forward link
	CYCLE_DETECTED = 1,    // Next link points at a visited page
	MAX_PAGES_REACHED = 2  // Safety cap hit
};

const char* StopReasonToString(CrawlStopReason reason);

struct CrawlResult {
	std::vector<CrawledPage> pages;  // Reading order, never re-sorted
	CrawlStopReason stop_reason = CrawlStopReason::END_OF_DOCUMENT;
	int64_t estimated_total_pages = -1;
};

struct CrawlProgress {
	int64_t processed = 0;
	int64_t estimated_total = -1;  // -1 while unknown
	int64_t max_pages = 0;
	PageRef current;

	// Denominator for display: the estimate, capped by max_pages
	int64_t DisplayTotal() const;
};

using ProgressCallback = std::function<void(const CrawlProgress &)>;
using SleepFunction = std::function<void(double seconds)>;

//===--------------------------------------------------------------------===//
// BookCrawler - Sequential page-chain crawl of one book
//===--------------------------------------------------------------------===//
// Follows the nearest forward page link until the document ends, a visited
// page comes up again, or max_pages is reached. Transport failures are
// retried with linear backoff; exhausted retries and pages without a
// reading region abort the whole run.
class BookCrawler {
public:
	BookCrawler(PageFetcher &fetcher, const CrawlOptions &options);

	void SetProgressCallback(ProgressCallback callback) { progress_callback_ = std::move(callback); }
	// Replaces the blocking sleep used for backoff and delays
	void SetSleepFunction(SleepFunction sleep) { sleep_ = std::move(sleep); }

	// Throws InvalidPageUrlException, TransportException, ReaderNotFoundException
	CrawlResult Run(const std::string &start_url);

private:
	FetchedPage FetchWithRetry(const std::string &url);
	void Sleep(double seconds);

	PageFetcher &fetcher_;
	CrawlOptions options_;
	ProgressCallback progress_callback_;
	SleepFunction sleep_;
};

} // namespace eshia
