#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace eshia {

// Identity of one reader page: /<book_id>/<volume>/<page>
struct PageRef {
	int64_t book_id = 0;
	int64_t volume = 0;
	int64_t page = 0;

	bool operator==(const PageRef &other) const {
		return book_id == other.book_id && volume == other.volume && page == other.page;
	}
	bool operator!=(const PageRef &other) const { return !(*this == other); }

	// Reading order within one book: volume first, then page
	bool IsAfter(const PageRef &other) const {
		if (volume != other.volume) {
			return volume > other.volume;
		}
		return page > other.page;
	}

	std::string ToString() const;
};

struct PageRefHash {
	size_t operator()(const PageRef &ref) const {
		size_t h = std::hash<int64_t>()(ref.book_id);
		h = h * 31 + std::hash<int64_t>()(ref.volume);
		h = h * 31 + std::hash<int64_t>()(ref.page);
		return h;
	}
};

// Parse the page identity from the URL path (query and fragment ignored).
// Throws InvalidPageUrlException when the path does not end with three
// unsigned integers, optionally followed by a slash.
PageRef DerivePageRef(const std::string &url);

// Same as DerivePageRef but reports failure through the return value
bool TryDerivePageRef(const std::string &url, PageRef &out);

} // namespace eshia
