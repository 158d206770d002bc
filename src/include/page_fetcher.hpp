#pragma once

#include "http_client.hpp"
#include <string>

namespace eshia {

// Desktop browser identity expected by the reader site
extern const char *DEFAULT_USER_AGENT;
extern const char *DEFAULT_ACCEPT_LANGUAGE;

//===--------------------------------------------------------------------===//
// FetchedPage - Raw page bytes as delivered by the transport
//===--------------------------------------------------------------------===//
struct FetchedPage {
	std::string body;
	std::string charset;  // Declared charset, lowercased ("" if none)
};

// Transport seam of the crawler. Implementations throw TransportException
// on any network or HTTP failure.
class PageFetcher {
public:
	virtual ~PageFetcher() = default;

	virtual FetchedPage Fetch(const std::string &url, double timeout_seconds) = 0;
};

class CurlPageFetcher : public PageFetcher {
public:
	CurlPageFetcher(const std::string &user_agent = DEFAULT_USER_AGENT,
	                const std::string &accept_language = DEFAULT_ACCEPT_LANGUAGE);

	FetchedPage Fetch(const std::string &url, double timeout_seconds) override;

private:
	HttpClient client_;
	std::string user_agent_;
	std::string accept_language_;
};

} // namespace eshia
