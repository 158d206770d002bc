#include "crawler_utils.hpp"
#include "link_parser.hpp"
#include "page_ref.hpp"
#include <libxml/encoding.h>
#include <libxml/tree.h>
#include <zlib.h>
#include <algorithm>
#include <cctype>
#include <climits>
#include <cstring>

namespace eshia {

//===--------------------------------------------------------------------===//
// Error Classification
//===--------------------------------------------------------------------===//

const char* ErrorTypeToString(FetchErrorType type) {
	switch (type) {
		case FetchErrorType::NONE: return "";
		case FetchErrorType::NETWORK_TIMEOUT: return "network_timeout";
		case FetchErrorType::NETWORK_DNS_FAILURE: return "network_dns_failure";
		case FetchErrorType::NETWORK_CONNECTION_REFUSED: return "network_connection_refused";
		case FetchErrorType::NETWORK_SSL_ERROR: return "network_ssl_error";
		case FetchErrorType::HTTP_CLIENT_ERROR: return "http_client_error";
		case FetchErrorType::HTTP_SERVER_ERROR: return "http_server_error";
		case FetchErrorType::HTTP_RATE_LIMITED: return "http_rate_limited";
		default: return "unknown";
	}
}

FetchErrorType ClassifyError(int status_code, const std::string &error_msg) {
	if (status_code == 429) return FetchErrorType::HTTP_RATE_LIMITED;
	if (status_code >= 500 && status_code < 600) return FetchErrorType::HTTP_SERVER_ERROR;
	if (status_code >= 400 && status_code < 500) return FetchErrorType::HTTP_CLIENT_ERROR;
	if (status_code <= 0) {
		// Network error - classify from message
		if (error_msg.find("timeout") != std::string::npos ||
		    error_msg.find("Timeout") != std::string::npos ||
		    error_msg.find("timed out") != std::string::npos) {
			return FetchErrorType::NETWORK_TIMEOUT;
		}
		if (error_msg.find("DNS") != std::string::npos ||
		    error_msg.find("resolve") != std::string::npos) {
			return FetchErrorType::NETWORK_DNS_FAILURE;
		}
		if (error_msg.find("SSL") != std::string::npos ||
		    error_msg.find("certificate") != std::string::npos) {
			return FetchErrorType::NETWORK_SSL_ERROR;
		}
		if (error_msg.find("refused") != std::string::npos ||
		    error_msg.find("connect") != std::string::npos) {
			return FetchErrorType::NETWORK_CONNECTION_REFUSED;
		}
		return FetchErrorType::NETWORK_TIMEOUT;  // Default network error
	}
	return FetchErrorType::NONE;
}

//===--------------------------------------------------------------------===//
// Compression Utilities
//===--------------------------------------------------------------------===//

std::string DecompressGzip(const std::string &compressed_data) {
	if (compressed_data.empty()) {
		return "";
	}

	z_stream zs;
	memset(&zs, 0, sizeof(zs));

	// Use inflateInit2 with 16+MAX_WBITS to handle gzip format
	if (inflateInit2(&zs, 16 + MAX_WBITS) != Z_OK) {
		return "";
	}

	zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed_data.data()));
	zs.avail_in = static_cast<uInt>(compressed_data.size());

	std::string decompressed;
	char buffer[32768];

	int ret;
	do {
		zs.next_out = reinterpret_cast<Bytef*>(buffer);
		zs.avail_out = sizeof(buffer);

		ret = inflate(&zs, Z_NO_FLUSH);

		if (ret != Z_OK && ret != Z_STREAM_END) {
			inflateEnd(&zs);
			return "";
		}

		size_t have = sizeof(buffer) - zs.avail_out;
		decompressed.append(buffer, have);
	} while (ret != Z_STREAM_END);

	inflateEnd(&zs);
	return decompressed;
}

bool IsGzippedData(const std::string &data) {
	return data.size() >= 2 &&
	       static_cast<unsigned char>(data[0]) == 0x1f &&
	       static_cast<unsigned char>(data[1]) == 0x8b;
}

//===--------------------------------------------------------------------===//
// Backoff
//===--------------------------------------------------------------------===//

double LinearBackoffSeconds(int attempt) {
	if (attempt < 1) {
		return 0.0;
	}
	return 0.8 * attempt;
}

//===--------------------------------------------------------------------===//
// Charset Utilities
//===--------------------------------------------------------------------===//

std::string ExtractCharset(const std::string &content_type) {
	std::string lower = content_type;
	std::transform(lower.begin(), lower.end(), lower.begin(),
	               [](unsigned char c) { return std::tolower(c); });

	size_t pos = lower.find("charset=");
	if (pos == std::string::npos) {
		return "";
	}

	size_t start = pos + 8;
	size_t end = lower.find(';', start);
	std::string charset = lower.substr(start, end == std::string::npos ? std::string::npos : end - start);

	// Trim whitespace and quotes
	while (!charset.empty() && (std::isspace(static_cast<unsigned char>(charset.back())) ||
	                            charset.back() == '"' || charset.back() == '\'')) {
		charset.pop_back();
	}
	while (!charset.empty() && (std::isspace(static_cast<unsigned char>(charset.front())) ||
	                            charset.front() == '"' || charset.front() == '\'')) {
		charset.erase(charset.begin());
	}
	return charset;
}

// Helper: Length of the valid UTF-8 sequence at pos, 0 if invalid
static size_t ValidSequenceLength(const std::string &data, size_t pos) {
	auto byte = [&](size_t i) { return static_cast<unsigned char>(data[i]); };
	auto cont = [&](size_t i) { return i < data.size() && (byte(i) & 0xC0) == 0x80; };

	unsigned char c = byte(pos);
	if (c < 0x80) {
		return 1;
	}
	if (c >= 0xC2 && c <= 0xDF) {
		return cont(pos + 1) ? 2 : 0;
	}
	if (c >= 0xE0 && c <= 0xEF) {
		if (!cont(pos + 1) || !cont(pos + 2)) {
			return 0;
		}
		unsigned char c1 = byte(pos + 1);
		if (c == 0xE0 && c1 < 0xA0) return 0;  // Overlong
		if (c == 0xED && c1 > 0x9F) return 0;  // Surrogate
		return 3;
	}
	if (c >= 0xF0 && c <= 0xF4) {
		if (!cont(pos + 1) || !cont(pos + 2) || !cont(pos + 3)) {
			return 0;
		}
		unsigned char c1 = byte(pos + 1);
		if (c == 0xF0 && c1 < 0x90) return 0;  // Overlong
		if (c == 0xF4 && c1 > 0x8F) return 0;  // Beyond U+10FFFF
		return 4;
	}
	return 0;
}

std::string SanitizeUtf8(const std::string &data) {
	static const char REPLACEMENT[] = "\xEF\xBF\xBD";

	std::string result;
	result.reserve(data.size());
	size_t pos = 0;
	while (pos < data.size()) {
		size_t len = ValidSequenceLength(data, pos);
		if (len == 0) {
			result.append(REPLACEMENT, 3);
			pos++;
		} else {
			result.append(data, pos, len);
			pos += len;
		}
	}
	return result;
}

// RAII wrapper for xmlBuffer
class XmlBufferGuard {
public:
	explicit XmlBufferGuard(xmlBufferPtr buffer) : buffer_(buffer) {}
	~XmlBufferGuard() {
		if (buffer_) {
			xmlBufferFree(buffer_);
		}
	}

	XmlBufferGuard(const XmlBufferGuard&) = delete;
	XmlBufferGuard& operator=(const XmlBufferGuard&) = delete;

	xmlBufferPtr get() const { return buffer_; }
	explicit operator bool() const { return buffer_ != nullptr; }

private:
	xmlBufferPtr buffer_;
};

// Helper: Convert with a libxml2 handler, false on any failure
static bool ConvertWithHandler(xmlCharEncodingHandlerPtr handler, const std::string &body, std::string &out) {
	if (body.size() > static_cast<size_t>(INT_MAX / 4)) {
		return false;
	}

	XmlBufferGuard in(xmlBufferCreateSize(body.size() + 1));
	XmlBufferGuard converted(xmlBufferCreateSize(body.size() * 2 + 64));
	if (!in || !converted) {
		return false;
	}
	if (xmlBufferAdd(in.get(), reinterpret_cast<const xmlChar *>(body.data()), static_cast<int>(body.size())) != 0) {
		return false;
	}

	// Handler converts as much as fits per call
	while (xmlBufferLength(in.get()) > 0) {
		int remaining = xmlBufferLength(in.get());
		int rc = xmlCharEncInFunc(handler, converted.get(), in.get());
		if (rc == -2) {
			return false;
		}
		if (xmlBufferLength(in.get()) == remaining) {
			return false;
		}
	}

	out.assign(reinterpret_cast<const char *>(xmlBufferContent(converted.get())),
	           static_cast<size_t>(xmlBufferLength(converted.get())));
	return true;
}

std::string DecodeToUtf8(const std::string &body, const std::string &charset) {
	std::string name = charset;
	std::transform(name.begin(), name.end(), name.begin(),
	               [](unsigned char c) { return std::tolower(c); });

	if (name.empty() || name == "utf-8" || name == "utf8") {
		return SanitizeUtf8(body);
	}

	xmlCharEncodingHandlerPtr handler = xmlFindCharEncodingHandler(name.c_str());
	if (!handler) {
		return SanitizeUtf8(body);
	}

	std::string converted;
	bool ok = ConvertWithHandler(handler, body, converted);
	xmlCharEncCloseFunc(handler);

	return SanitizeUtf8(ok ? converted : body);
}

std::string NormalizeLineEndings(const std::string &text) {
	std::string result;
	result.reserve(text.size());
	for (size_t i = 0; i < text.size(); i++) {
		if (text[i] == '\r') {
			result += '\n';
			if (i + 1 < text.size() && text[i + 1] == '\n') {
				i++;
			}
		} else {
			result += text[i];
		}
	}
	return result;
}

//===--------------------------------------------------------------------===//
// URL Utilities
//===--------------------------------------------------------------------===//

std::string GetUrlValidationError(const std::string &url) {
	if (url.empty()) {
		return "URL is empty";
	}

	std::string scheme = LinkParser::ExtractScheme(url);
	if (scheme.empty()) {
		return "URL must start with http:// or https://, got: " + url;
	}
	if (scheme != "http" && scheme != "https") {
		return "URL scheme must be http or https, got: " + scheme;
	}

	if (LinkParser::ExtractDomain(url).empty()) {
		return "URL has no hostname: " + url;
	}

	PageRef ref;
	if (!TryDerivePageRef(url, ref)) {
		return "URL must end with /<book_id>/<volume>/<page>, got: " + url;
	}

	return "";
}

} // namespace eshia
