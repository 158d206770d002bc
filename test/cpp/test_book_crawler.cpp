#include "book_crawler.hpp"
#include "reader_exception.hpp"
#include <gtest/gtest.h>
#include <deque>
#include <map>

using namespace eshia;

namespace {

// Scripted transport: each URL serves its queued outcomes in order, the
// last one repeating. An outcome with an error message throws.
struct ScriptedResponse {
	std::string body;
	std::string error;
	std::string charset;
};

class ScriptedPageFetcher : public PageFetcher {
public:
	void Serve(const std::string &url, const std::string &body, const std::string &charset = "") {
		script_[url].push_back(ScriptedResponse{body, "", charset});
	}

	void Fail(const std::string &url, const std::string &error) {
		script_[url].push_back(ScriptedResponse{"", error, ""});
	}

	FetchedPage Fetch(const std::string &url, double timeout_seconds) override {
		requests.push_back(url);
		last_timeout = timeout_seconds;

		auto it = script_.find(url);
		if (it == script_.end() || it->second.empty()) {
			throw TransportException("HTTP 404 (http_client_error)");
		}
		ScriptedResponse response = it->second.front();
		if (it->second.size() > 1) {
			it->second.pop_front();
		}
		if (!response.error.empty()) {
			throw TransportException(response.error);
		}

		FetchedPage page;
		page.body = response.body;
		page.charset = response.charset;
		return page;
	}

	std::vector<std::string> requests;
	double last_timeout = 0;

private:
	std::map<std::string, std::deque<ScriptedResponse>> script_;
};

std::string ReaderPage(const std::string &text, const std::vector<std::string> &links) {
	std::string html = "<html><body><div class=\"sticky-menue\">";
	for (const auto &link : links) {
		html += "<a href=\"" + link + "\">" + link + "</a>";
	}
	html += "</div><table><tr><td class=\"book-page-show\"><p>" + text + "</p></td></tr></table></body></html>";
	return html;
}

const std::string PAGE_1 = "https://lib.eshia.ir/15050/1/1";
const std::string PAGE_2 = "https://lib.eshia.ir/15050/1/2";
const std::string PAGE_3 = "https://lib.eshia.ir/15050/1/3";

class BookCrawlerTest : public ::testing::Test {
protected:
	void SetUp() override {
		fetcher.Serve(PAGE_1, ReaderPage("First", {"/15050/1/2", "/15050/1/3"}));
		fetcher.Serve(PAGE_2, ReaderPage("Second", {"/15050/1/1", "/15050/1/3"}));
		fetcher.Serve(PAGE_3, ReaderPage("Third", {"/15050/1/1", "/15050/1/2"}));
	}

	BookCrawler MakeCrawler(const CrawlOptions &options) {
		BookCrawler crawler(fetcher, options);
		crawler.SetSleepFunction([this](double seconds) { sleeps.push_back(seconds); });
		return crawler;
	}

	ScriptedPageFetcher fetcher;
	std::vector<double> sleeps;
};

} // namespace

TEST_F(BookCrawlerTest, FollowsChainToEndOfDocument) {
	BookCrawler crawler = MakeCrawler(CrawlOptions());
	CrawlResult result = crawler.Run(PAGE_1);

	ASSERT_EQ(result.pages.size(), 3u);
	EXPECT_EQ(result.pages[0].text, "First");
	EXPECT_EQ(result.pages[1].text, "Second");
	EXPECT_EQ(result.pages[2].text, "Third");
	EXPECT_EQ(result.pages[0].url, PAGE_1);
	EXPECT_EQ(result.pages[2].ref, (PageRef{15050, 1, 3}));
	EXPECT_EQ(result.stop_reason, CrawlStopReason::END_OF_DOCUMENT);
	EXPECT_EQ(result.estimated_total_pages, 3);
	EXPECT_EQ(fetcher.requests, (std::vector<std::string>{PAGE_1, PAGE_2, PAGE_3}));
	EXPECT_TRUE(sleeps.empty());
}

TEST_F(BookCrawlerTest, CanonicalizesStartUrl) {
	BookCrawler crawler = MakeCrawler(CrawlOptions());
	CrawlResult result = crawler.Run(PAGE_1 + "/?lang=fa#top");

	ASSERT_EQ(result.pages.size(), 3u);
	EXPECT_EQ(fetcher.requests.front(), PAGE_1);
}

TEST_F(BookCrawlerTest, RejectsInvalidStartUrl) {
	BookCrawler crawler = MakeCrawler(CrawlOptions());
	EXPECT_THROW(crawler.Run("https://lib.eshia.ir/15050/1"), InvalidPageUrlException);
	EXPECT_TRUE(fetcher.requests.empty());
}

TEST_F(BookCrawlerTest, RetriesWithLinearBackoff) {
	ScriptedPageFetcher flaky;
	flaky.Fail(PAGE_1, "Timeout was reached (network_timeout)");
	flaky.Fail(PAGE_1, "HTTP 503 (http_server_error)");
	flaky.Serve(PAGE_1, ReaderPage("Only", {}));

	CrawlOptions options;
	options.retries = 3;
	BookCrawler crawler(flaky, options);
	crawler.SetSleepFunction([this](double seconds) { sleeps.push_back(seconds); });

	CrawlResult result = crawler.Run(PAGE_1);
	ASSERT_EQ(result.pages.size(), 1u);
	EXPECT_EQ(result.pages[0].text, "Only");
	EXPECT_EQ(flaky.requests.size(), 3u);
	ASSERT_EQ(sleeps.size(), 2u);
	EXPECT_DOUBLE_EQ(sleeps[0], 0.8);
	EXPECT_DOUBLE_EQ(sleeps[1], 1.6);
}

TEST_F(BookCrawlerTest, ExhaustedRetriesAbortRun) {
	ScriptedPageFetcher broken;
	broken.Serve(PAGE_1, ReaderPage("First", {"/15050/1/2"}));
	broken.Fail(PAGE_2, "Could not resolve host (network_dns_failure)");

	CrawlOptions options;
	options.retries = 2;
	BookCrawler crawler(broken, options);
	crawler.SetSleepFunction([this](double seconds) { sleeps.push_back(seconds); });

	try {
		crawler.Run(PAGE_1);
		FAIL() << "expected TransportException";
	} catch (const TransportException &e) {
		EXPECT_EQ(std::string(e.what()),
		          "Failed to fetch " + PAGE_2 + ": Could not resolve host (network_dns_failure)");
	}
	EXPECT_EQ(broken.requests.size(), 3u);
	EXPECT_EQ(sleeps, (std::vector<double>{0.8}));
}

TEST_F(BookCrawlerTest, MissingReaderAbortsRun) {
	ScriptedPageFetcher fetcher_without_reader;
	fetcher_without_reader.Serve(PAGE_1, "<html><body><p>Maintenance</p></body></html>");

	BookCrawler crawler(fetcher_without_reader, CrawlOptions());
	try {
		crawler.Run(PAGE_1);
		FAIL() << "expected ReaderNotFoundException";
	} catch (const ReaderNotFoundException &e) {
		EXPECT_EQ(std::string(e.what()), "Reader element not found in: " + PAGE_1);
	}
}

TEST_F(BookCrawlerTest, StopsAtMaxPages) {
	CrawlOptions options;
	options.max_pages = 2;
	options.delay_seconds = 0.25;
	BookCrawler crawler = MakeCrawler(options);

	CrawlResult result = crawler.Run(PAGE_1);
	ASSERT_EQ(result.pages.size(), 2u);
	EXPECT_EQ(result.stop_reason, CrawlStopReason::MAX_PAGES_REACHED);
	EXPECT_EQ(fetcher.requests.size(), 2u);
	// No delay after the last allowed page
	EXPECT_EQ(sleeps, (std::vector<double>{0.25}));
}

TEST_F(BookCrawlerTest, DelaysBetweenPagesOnly) {
	CrawlOptions options;
	options.delay_seconds = 0.5;
	BookCrawler crawler = MakeCrawler(options);

	crawler.Run(PAGE_1);
	EXPECT_EQ(sleeps, (std::vector<double>{0.5, 0.5}));
}

TEST_F(BookCrawlerTest, ReportsProgressPerPage) {
	CrawlOptions options;
	options.max_pages = 50;
	BookCrawler crawler = MakeCrawler(options);

	std::vector<CrawlProgress> reports;
	crawler.SetProgressCallback([&reports](const CrawlProgress &progress) { reports.push_back(progress); });
	crawler.Run(PAGE_1);

	ASSERT_EQ(reports.size(), 3u);
	for (size_t i = 0; i < reports.size(); i++) {
		EXPECT_EQ(reports[i].processed, static_cast<int64_t>(i + 1));
		EXPECT_EQ(reports[i].estimated_total, 3);
		EXPECT_EQ(reports[i].max_pages, 50);
		EXPECT_EQ(reports[i].DisplayTotal(), 3);
	}
	EXPECT_EQ(reports[1].current, (PageRef{15050, 1, 2}));
}

TEST_F(BookCrawlerTest, EstimateDiscardedWhenContradicted) {
	ScriptedPageFetcher growing;
	growing.Serve(PAGE_1, ReaderPage("A", {"/15050/1/2"}));
	growing.Serve(PAGE_2, ReaderPage("B", {"/15050/2/0"}));
	growing.Serve("https://lib.eshia.ir/15050/2/0", ReaderPage("C", {}));

	BookCrawler crawler(growing, CrawlOptions());
	std::vector<int64_t> estimates;
	crawler.SetProgressCallback([&estimates](const CrawlProgress &progress) {
		estimates.push_back(progress.estimated_total);
	});
	CrawlResult result = crawler.Run(PAGE_1);

	ASSERT_EQ(result.pages.size(), 3u);
	EXPECT_EQ(result.pages[2].ref, (PageRef{15050, 2, 0}));
	// Page 1 sees up to page 2, page 2 sees no volume-1 links, then three
	// pages exceed the estimate of two
	EXPECT_EQ(estimates, (std::vector<int64_t>{2, 2, -1}));
	EXPECT_EQ(result.estimated_total_pages, -1);
}

TEST_F(BookCrawlerTest, DecodesDeclaredCharset) {
	ScriptedPageFetcher latin;
	latin.Serve(PAGE_1, ReaderPage("caf\xE9", {}), "iso-8859-1");

	BookCrawler crawler(latin, CrawlOptions());
	CrawlResult result = crawler.Run(PAGE_1);
	ASSERT_EQ(result.pages.size(), 1u);
	EXPECT_EQ(result.pages[0].text, "caf\xC3\xA9");
}

TEST_F(BookCrawlerTest, PassesTimeoutToTransport) {
	CrawlOptions options;
	options.timeout_seconds = 12.5;
	BookCrawler crawler = MakeCrawler(options);
	crawler.Run(PAGE_1);
	EXPECT_DOUBLE_EQ(fetcher.last_timeout, 12.5);
}

TEST(CrawlOptionsTest, RejectsOutOfRangeValues) {
	CrawlOptions options;
	EXPECT_NO_THROW(ValidateCrawlOptions(options));

	options.max_pages = 0;
	EXPECT_THROW(ValidateCrawlOptions(options), ArgumentException);

	options = CrawlOptions();
	options.retries = 0;
	EXPECT_THROW(ValidateCrawlOptions(options), ArgumentException);

	options = CrawlOptions();
	options.timeout_seconds = 0;
	EXPECT_THROW(ValidateCrawlOptions(options), ArgumentException);

	options = CrawlOptions();
	options.delay_seconds = -1;
	EXPECT_THROW(ValidateCrawlOptions(options), ArgumentException);

	ScriptedPageFetcher fetcher;
	options = CrawlOptions();
	options.max_pages = -5;
	EXPECT_THROW(BookCrawler crawler(fetcher, options), ArgumentException);
}

TEST(CrawlProgressTest, DisplayTotalCapsEstimate) {
	CrawlProgress progress;
	progress.max_pages = 10;
	EXPECT_EQ(progress.DisplayTotal(), 10);
	progress.estimated_total = 4;
	EXPECT_EQ(progress.DisplayTotal(), 4);
	progress.estimated_total = 40;
	EXPECT_EQ(progress.DisplayTotal(), 10);
	progress.estimated_total = 0;
	EXPECT_EQ(progress.DisplayTotal(), 1);
}

TEST(CrawlStopReasonTest, Names) {
	EXPECT_STREQ(StopReasonToString(CrawlStopReason::END_OF_DOCUMENT), "end_of_document");
	EXPECT_STREQ(StopReasonToString(CrawlStopReason::CYCLE_DETECTED), "cycle_detected");
	EXPECT_STREQ(StopReasonToString(CrawlStopReason::MAX_PAGES_REACHED), "max_pages_reached");
}
