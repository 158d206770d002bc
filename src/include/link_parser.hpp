#pragma once

#include <string>

namespace eshia {

class LinkParser {
public:
	// Resolve href against the URL of the page it was found on.
	// Returns empty string for hrefs that cannot point at a page
	// (javascript:, mailto:, tel:, data:, empty).
	static std::string ResolveUrl(const std::string &base_url, const std::string &href);

	// Drop query and fragment, trim trailing slashes from the path.
	// An empty path becomes "/". Idempotent.
	static std::string CanonicalizeUrl(const std::string &url);

	// Extract scheme from URL, lowercased ("" if none)
	static std::string ExtractScheme(const std::string &url);

	// Extract domain from URL (lowercased, without port)
	static std::string ExtractDomain(const std::string &url);

	// Extract path from URL (without query string and fragment)
	static std::string ExtractPath(const std::string &url);
};

} // namespace eshia
