#include "page_fetcher.hpp"
#include "crawler_utils.hpp"
#include "reader_exception.hpp"

namespace eshia {

const char *DEFAULT_USER_AGENT =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) "
    "AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/122.0.0.0 Safari/537.36";

const char *DEFAULT_ACCEPT_LANGUAGE = "ar,fa;q=0.9,en;q=0.5";

CurlPageFetcher::CurlPageFetcher(const std::string &user_agent, const std::string &accept_language)
    : user_agent_(user_agent), accept_language_(accept_language) {
}

FetchedPage CurlPageFetcher::Fetch(const std::string &url, double timeout_seconds) {
	HttpRequestOptions options;
	options.user_agent = user_agent_;
	options.accept_language = accept_language_;
	options.timeout_seconds = timeout_seconds;

	HttpResponse response = client_.Get(url, options);
	if (!response.success) {
		FetchErrorType type = ClassifyError(response.status_code, response.error);
		throw TransportException(response.error + " (" + ErrorTypeToString(type) + ")");
	}

	FetchedPage page;
	page.charset = ExtractCharset(response.content_type);

	// Some servers gzip the body without announcing it
	if (IsGzippedData(response.body)) {
		std::string inflated = DecompressGzip(response.body);
		if (!inflated.empty()) {
			response.body = std::move(inflated);
		}
	}
	page.body = std::move(response.body);

	return page;
}

} // namespace eshia
