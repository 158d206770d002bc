#include "page_ref.hpp"
#include "link_parser.hpp"
#include "reader_exception.hpp"
#include <cctype>
#include <limits>

namespace eshia {

// Helper: Parse an unsigned decimal segment, rejecting overflow
static bool ParseNumberSegment(const std::string &segment, int64_t &out) {
	if (segment.empty()) {
		return false;
	}
	int64_t value = 0;
	for (char c : segment) {
		if (!std::isdigit(static_cast<unsigned char>(c))) {
			return false;
		}
		int digit = c - '0';
		if (value > (std::numeric_limits<int64_t>::max() - digit) / 10) {
			return false;
		}
		value = value * 10 + digit;
	}
	out = value;
	return true;
}

std::string PageRef::ToString() const {
	return std::to_string(book_id) + "/" + std::to_string(volume) + "/" + std::to_string(page);
}

bool TryDerivePageRef(const std::string &url, PageRef &out) {
	std::string path = LinkParser::ExtractPath(url);

	// One optional trailing slash
	if (path.length() > 1 && path.back() == '/') {
		path.pop_back();
	}

	// Walk back over the last three segments: page, volume, book_id
	int64_t values[3];
	size_t end = path.length();
	for (int i = 2; i >= 0; i--) {
		size_t slash = path.rfind('/', end == 0 ? 0 : end - 1);
		if (slash == std::string::npos || slash >= end) {
			return false;
		}
		if (!ParseNumberSegment(path.substr(slash + 1, end - slash - 1), values[i])) {
			return false;
		}
		end = slash;
	}

	out.book_id = values[0];
	out.volume = values[1];
	out.page = values[2];
	return true;
}

PageRef DerivePageRef(const std::string &url) {
	PageRef ref;
	if (!TryDerivePageRef(url, ref)) {
		throw InvalidPageUrlException(url);
	}
	return ref;
}

} // namespace eshia
