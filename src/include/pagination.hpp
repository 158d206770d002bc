#pragma once

#include "page_ref.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace eshia {

// Nearest forward page of the same book among the links found on the
// current page, compared by (volume, page). Links are resolved against
// current_url and canonicalized; unparsable links are skipped.
// Returns empty string when no forward link exists.
std::string FindNextPageUrl(const std::string &current_url, const PageRef &current_ref,
                            const std::vector<std::string> &hrefs);

// Highest page number linked within the current book and volume, never
// below the current page. Returns -1 when no link points into the volume.
int64_t DiscoverLastPageInVolume(const std::string &current_url, const PageRef &current_ref,
                                 const std::vector<std::string> &hrefs);

} // namespace eshia
