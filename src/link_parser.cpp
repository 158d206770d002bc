#include "link_parser.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace eshia {

// Helper: Convert string to lowercase
static std::string ToLower(const std::string &str) {
	std::string result = str;
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	return result;
}

// Helper: Trim whitespace
static std::string Trim(const std::string &str) {
	size_t start = 0;
	size_t end = str.length();
	while (start < end && std::isspace(static_cast<unsigned char>(str[start]))) {
		start++;
	}
	while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
		end--;
	}
	return str.substr(start, end - start);
}

// Helper: Position where query string or fragment starts (or length)
static size_t FindSuffixStart(const std::string &url, size_t from) {
	size_t pos = url.find_first_of("?#", from);
	return pos == std::string::npos ? url.length() : pos;
}

// Helper: Normalize path (resolve . and ..)
static std::string NormalizePath(const std::string &path) {
	std::vector<std::string> segments;
	size_t pos = 0;

	while (pos < path.length()) {
		size_t next = path.find('/', pos);
		if (next == std::string::npos) {
			next = path.length();
		}

		std::string segment = path.substr(pos, next - pos);

		if (segment == "..") {
			if (!segments.empty()) {
				segments.pop_back();
			}
		} else if (segment != "." && !segment.empty()) {
			segments.push_back(segment);
		}

		pos = next + 1;
	}

	std::string result = "/";
	for (size_t i = 0; i < segments.size(); i++) {
		result += segments[i];
		if (i < segments.size() - 1) {
			result += "/";
		}
	}

	// Preserve trailing slash if original had one (or ended in a dot segment)
	bool trailing = path.length() > 1 &&
	                (path.back() == '/' || (path.length() >= 2 && path.substr(path.length() - 2) == "/.") ||
	                 (path.length() >= 3 && path.substr(path.length() - 3) == "/.."));
	if (trailing && result.back() != '/') {
		result += "/";
	}

	return result;
}

// Helper: Position of the ':' ending a leading scheme ([A-Za-z][A-Za-z0-9+.-]*),
// npos if the URL does not start with one
static size_t FindSchemeEnd(const std::string &url) {
	if (url.empty() || !std::isalpha(static_cast<unsigned char>(url[0]))) {
		return std::string::npos;
	}
	for (size_t i = 1; i < url.length(); i++) {
		unsigned char c = static_cast<unsigned char>(url[i]);
		if (c == ':') {
			return i;
		}
		if (!std::isalnum(c) && c != '+' && c != '.' && c != '-') {
			return std::string::npos;
		}
	}
	return std::string::npos;
}

// Helper: Position of "://" after a leading scheme, npos if not hierarchical
static size_t FindAuthorityStart(const std::string &url) {
	size_t scheme_end = FindSchemeEnd(url);
	if (scheme_end == std::string::npos || url.compare(scheme_end, 3, "://") != 0) {
		return std::string::npos;
	}
	return scheme_end;
}

// Helper: Origin (scheme://authority) of an absolute URL, or empty
static std::string ExtractOrigin(const std::string &url) {
	size_t proto_end = FindAuthorityStart(url);
	if (proto_end == std::string::npos) {
		return "";
	}
	size_t authority_end = url.find_first_of("/?#", proto_end + 3);
	if (authority_end == std::string::npos) {
		authority_end = url.length();
	}
	return url.substr(0, authority_end);
}

std::string LinkParser::ExtractScheme(const std::string &url) {
	size_t proto_end = FindAuthorityStart(url);
	if (proto_end == std::string::npos) {
		return "";
	}
	return ToLower(url.substr(0, proto_end));
}

std::string LinkParser::ExtractDomain(const std::string &url) {
	std::string origin = ExtractOrigin(url);
	if (origin.empty()) {
		return "";
	}

	std::string domain = origin.substr(origin.find("://") + 3);

	// Remove credentials if present
	size_t at_pos = domain.rfind('@');
	if (at_pos != std::string::npos) {
		domain = domain.substr(at_pos + 1);
	}

	// Remove port if present
	size_t port_pos = domain.find(':');
	if (port_pos != std::string::npos) {
		domain = domain.substr(0, port_pos);
	}

	return ToLower(domain);
}

std::string LinkParser::ExtractPath(const std::string &url) {
	size_t path_start;
	size_t proto_end = FindAuthorityStart(url);
	if (proto_end == std::string::npos) {
		path_start = 0;
	} else {
		path_start = url.find_first_of("/?#", proto_end + 3);
		if (path_start == std::string::npos || url[path_start] != '/') {
			return "/";
		}
	}

	// Remove query string and fragment
	size_t path_end = FindSuffixStart(url, path_start);
	std::string path = url.substr(path_start, path_end - path_start);
	return path.empty() ? "/" : path;
}

std::string LinkParser::CanonicalizeUrl(const std::string &url) {
	std::string origin = ExtractOrigin(url);
	std::string path = ExtractPath(url);

	size_t end = path.find_last_not_of('/');
	path = (end == std::string::npos) ? "/" : path.substr(0, end + 1);

	return origin + path;
}

std::string LinkParser::ResolveUrl(const std::string &base_url, const std::string &href) {
	std::string trimmed_href = Trim(href);
	if (trimmed_href.empty()) {
		return "";
	}

	std::string lower_href = ToLower(trimmed_href);
	if (lower_href.find("javascript:") == 0 ||
	    lower_href.find("mailto:") == 0 ||
	    lower_href.find("tel:") == 0 ||
	    lower_href.find("data:") == 0) {
		return "";
	}

	// Already absolute: a scheme before any '/', '?' or '#'
	if (FindSchemeEnd(trimmed_href) != std::string::npos) {
		return trimmed_href;
	}

	std::string base_origin = ExtractOrigin(base_url);
	if (base_origin.empty()) {
		return "";
	}

	// Protocol-relative (//example.com/path)
	if (trimmed_href.length() >= 2 && trimmed_href[0] == '/' && trimmed_href[1] == '/') {
		return base_origin.substr(0, base_origin.find(':') + 1) + trimmed_href;
	}

	std::string base_path = ExtractPath(base_url);

	// Same document: fragment only
	if (trimmed_href[0] == '#') {
		size_t query_start = base_origin.length() + base_path.length();
		size_t frag_pos = base_url.find('#', query_start);
		std::string without_fragment = frag_pos == std::string::npos ? base_url : base_url.substr(0, frag_pos);
		return without_fragment + trimmed_href;
	}

	// Same path: query only
	if (trimmed_href[0] == '?') {
		return base_origin + base_path + trimmed_href;
	}

	size_t suffix_start = FindSuffixStart(trimmed_href, 0);
	std::string href_path = trimmed_href.substr(0, suffix_start);
	std::string href_suffix = trimmed_href.substr(suffix_start);

	// Absolute path (/path)
	if (href_path[0] == '/') {
		return base_origin + NormalizePath(href_path) + href_suffix;
	}

	// Relative path (path or ../path): keep the base directory
	size_t last_slash = base_path.rfind('/');
	std::string base_dir = (last_slash != std::string::npos) ? base_path.substr(0, last_slash + 1) : "/";

	return base_origin + NormalizePath(base_dir + href_path) + href_suffix;
}

} // namespace eshia
