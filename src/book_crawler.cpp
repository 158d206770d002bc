#include "book_crawler.hpp"
#include "crawler_utils.hpp"
#include "link_parser.hpp"
#include "page_text_extractor.hpp"
#include "pagination.hpp"
#include "reader_exception.hpp"
#include <algorithm>
#include <chrono>
#include <thread>
#include <unordered_set>

namespace eshia {

void ValidateCrawlOptions(const CrawlOptions &options) {
	if (options.max_pages < 1) {
		throw ArgumentException("max_pages must be >= 1");
	}
	if (options.retries < 1) {
		throw ArgumentException("retries must be >= 1");
	}
	if (!(options.timeout_seconds > 0)) {
		throw ArgumentException("timeout must be > 0");
	}
	if (!(options.delay_seconds >= 0)) {
		throw ArgumentException("delay must be >= 0");
	}
}

const char* StopReasonToString(CrawlStopReason reason) {
	switch (reason) {
		case CrawlStopReason::END_OF_DOCUMENT: return "end_of_document";
		case CrawlStopReason::CYCLE_DETECTED: return "cycle_detected";
		case CrawlStopReason::MAX_PAGES_REACHED: return "max_pages_reached";
		default: return "unknown";
	}
}

int64_t CrawlProgress::DisplayTotal() const {
	int64_t total = max_pages;
	if (estimated_total >= 0) {
		total = std::min(total, estimated_total);
	}
	return std::max<int64_t>(1, total);
}

BookCrawler::BookCrawler(PageFetcher &fetcher, const CrawlOptions &options)
    : fetcher_(fetcher), options_(options) {
	ValidateCrawlOptions(options_);
}

void BookCrawler::Sleep(double seconds) {
	if (seconds <= 0) {
		return;
	}
	if (sleep_) {
		sleep_(seconds);
		return;
	}
	std::this_thread::sleep_for(std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000)));
}

FetchedPage BookCrawler::FetchWithRetry(const std::string &url) {
	std::string last_error;
	for (int attempt = 1; attempt <= options_.retries; attempt++) {
		try {
			return fetcher_.Fetch(url, options_.timeout_seconds);
		} catch (const TransportException &e) {
			last_error = e.what();
			if (attempt < options_.retries) {
				Sleep(LinearBackoffSeconds(attempt));
			}
		}
	}
	throw TransportException("Failed to fetch " + url + ": " + last_error);
}

CrawlResult BookCrawler::Run(const std::string &start_url) {
	std::string current_url = LinkParser::CanonicalizeUrl(start_url);
	const PageRef start_ref = DerivePageRef(current_url);

	CrawlResult result;
	result.stop_reason = CrawlStopReason::MAX_PAGES_REACHED;
	std::unordered_set<PageRef, PageRefHash> visited;

	for (int64_t iteration = 0; iteration < options_.max_pages; iteration++) {
		PageRef current_ref = DerivePageRef(current_url);
		if (visited.count(current_ref)) {
			result.stop_reason = CrawlStopReason::CYCLE_DETECTED;
			break;
		}
		visited.insert(current_ref);

		FetchedPage fetched = FetchWithRetry(current_url);
		PageExtraction extraction = ExtractPageText(DecodeToUtf8(fetched.body, fetched.charset));
		if (!extraction.found_reader) {
			throw ReaderNotFoundException(current_url);
		}

		result.pages.push_back(CrawledPage{current_ref, current_url, std::move(extraction.text)});

		// Total estimate only holds while still inside the starting volume
		int64_t last_page = DiscoverLastPageInVolume(current_url, current_ref, extraction.hrefs);
		if (last_page >= 0 && current_ref.volume == start_ref.volume && last_page >= start_ref.page) {
			result.estimated_total_pages = last_page - start_ref.page + 1;
		}
		auto fetched_count = static_cast<int64_t>(result.pages.size());
		if (result.estimated_total_pages >= 0 && fetched_count > result.estimated_total_pages) {
			result.estimated_total_pages = -1;
		}

		if (progress_callback_) {
			CrawlProgress progress;
			progress.processed = fetched_count;
			progress.estimated_total = result.estimated_total_pages;
			progress.max_pages = options_.max_pages;
			progress.current = current_ref;
			progress_callback_(progress);
		}

		std::string next_url = FindNextPageUrl(current_url, current_ref, extraction.hrefs);
		if (next_url.empty()) {
			result.stop_reason = CrawlStopReason::END_OF_DOCUMENT;
			break;
		}
		if (visited.count(DerivePageRef(next_url))) {
			result.stop_reason = CrawlStopReason::CYCLE_DETECTED;
			break;
		}

		current_url = next_url;
		if (iteration + 1 < options_.max_pages) {
			Sleep(options_.delay_seconds);
		}
	}

	return result;
}

} // namespace eshia
