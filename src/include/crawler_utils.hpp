#pragma once

#include <string>
#include <cstdint>

namespace eshia {

//===--------------------------------------------------------------------===//
// Error Classification
//===--------------------------------------------------------------------===//

enum class FetchErrorType : uint8_t {
	NONE = 0,
	NETWORK_TIMEOUT = 1,
	NETWORK_DNS_FAILURE = 2,
	NETWORK_CONNECTION_REFUSED = 3,
	NETWORK_SSL_ERROR = 4,
	HTTP_CLIENT_ERROR = 5,
	HTTP_SERVER_ERROR = 6,
	HTTP_RATE_LIMITED = 7
};

const char* ErrorTypeToString(FetchErrorType type);
FetchErrorType ClassifyError(int status_code, const std::string &error_msg);

//===--------------------------------------------------------------------===//
// Compression Utilities
//===--------------------------------------------------------------------===//

// Decompress gzip data. Returns empty string on error.
std::string DecompressGzip(const std::string &compressed_data);

// Check if data starts with gzip magic bytes (0x1f 0x8b)
bool IsGzippedData(const std::string &data);

//===--------------------------------------------------------------------===//
// Backoff
//===--------------------------------------------------------------------===//

// Linear backoff after failed attempt n (1-based): 0.8s, 1.6s, 2.4s, ...
double LinearBackoffSeconds(int attempt);

//===--------------------------------------------------------------------===//
// Charset Utilities
//===--------------------------------------------------------------------===//

// charset parameter of a Content-Type header, lowercased ("" if absent)
std::string ExtractCharset(const std::string &content_type);

// Replace invalid UTF-8 sequences with U+FFFD
std::string SanitizeUtf8(const std::string &data);

// Decode body from the declared charset to UTF-8 using libxml2's encoding
// handlers. Unknown charsets and conversion failures fall back to UTF-8
// with replacement characters.
std::string DecodeToUtf8(const std::string &body, const std::string &charset);

// Convert CRLF and lone CR to LF
std::string NormalizeLineEndings(const std::string &text);

//===--------------------------------------------------------------------===//
// URL Utilities
//===--------------------------------------------------------------------===//

// Get validation error message for a start URL. Returns empty string if valid.
// Checks: http/https scheme, non-empty hostname, /<book_id>/<volume>/<page> path
std::string GetUrlValidationError(const std::string &url);

} // namespace eshia
