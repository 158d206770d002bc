#include "pagination.hpp"
#include "link_parser.hpp"
#include <map>
#include <utility>

namespace eshia {

// Helper: Resolve, canonicalize and identify one href; false if it is not a page link
static bool ResolvePageLink(const std::string &current_url, const std::string &href,
                            std::string &canonical, PageRef &ref) {
	std::string absolute_url = LinkParser::ResolveUrl(current_url, href);
	if (absolute_url.empty()) {
		return false;
	}
	canonical = LinkParser::CanonicalizeUrl(absolute_url);
	return TryDerivePageRef(canonical, ref);
}

std::string FindNextPageUrl(const std::string &current_url, const PageRef &current_ref,
                            const std::vector<std::string> &hrefs) {
	// Ordered by (volume, page); first URL seen per key wins
	std::map<std::pair<int64_t, int64_t>, std::string> candidates;

	for (const auto &href : hrefs) {
		std::string canonical;
		PageRef candidate;
		if (!ResolvePageLink(current_url, href, canonical, candidate)) {
			continue;
		}
		if (candidate.book_id != current_ref.book_id) {
			continue;
		}
		if (!candidate.IsAfter(current_ref)) {
			continue;
		}
		candidates.emplace(std::make_pair(candidate.volume, candidate.page), canonical);
	}

	if (candidates.empty()) {
		return "";
	}
	return candidates.begin()->second;
}

int64_t DiscoverLastPageInVolume(const std::string &current_url, const PageRef &current_ref,
                                 const std::vector<std::string> &hrefs) {
	int64_t highest_page = current_ref.page;
	bool found = false;

	for (const auto &href : hrefs) {
		std::string canonical;
		PageRef candidate;
		if (!ResolvePageLink(current_url, href, canonical, candidate)) {
			continue;
		}
		if (candidate.book_id != current_ref.book_id || candidate.volume != current_ref.volume) {
			continue;
		}

		found = true;
		if (candidate.page > highest_page) {
			highest_page = candidate.page;
		}
	}

	return found ? highest_page : -1;
}

} // namespace eshia
