#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace eshia {

//===--------------------------------------------------------------------===//
// Error Classification
//===--------------------------------------------------------------------===//

enum class ReaderErrorType : uint8_t {
	INVALID_PAGE_URL = 0,
	TRANSPORT = 1,
	READER_NOT_FOUND = 2,
	ARGUMENT = 3,
	OUTPUT = 4
};

const char* ReaderErrorTypeToString(ReaderErrorType type);

class ReaderException : public std::runtime_error {
public:
	ReaderException(ReaderErrorType type, const std::string &message)
	    : std::runtime_error(message), type_(type) {}

	ReaderErrorType GetType() const { return type_; }

private:
	ReaderErrorType type_;
};

// Start URL or candidate link does not end with /<book_id>/<volume>/<page>
class InvalidPageUrlException : public ReaderException {
public:
	explicit InvalidPageUrlException(const std::string &url)
	    : ReaderException(ReaderErrorType::INVALID_PAGE_URL,
	                      "URL must end with /<book_id>/<volume>/<page>, got: " + url),
	      url_(url) {}

	const std::string &GetUrl() const { return url_; }

private:
	std::string url_;
};

// Network or HTTP failure; retried per fetch by the crawler
class TransportException : public ReaderException {
public:
	explicit TransportException(const std::string &message)
	    : ReaderException(ReaderErrorType::TRANSPORT, message) {}
};

// Fetched page has no reading region
class ReaderNotFoundException : public ReaderException {
public:
	explicit ReaderNotFoundException(const std::string &url)
	    : ReaderException(ReaderErrorType::READER_NOT_FOUND, "Reader element not found in: " + url) {}
};

class ArgumentException : public ReaderException {
public:
	explicit ArgumentException(const std::string &message)
	    : ReaderException(ReaderErrorType::ARGUMENT, message) {}
};

class OutputException : public ReaderException {
public:
	explicit OutputException(const std::string &message)
	    : ReaderException(ReaderErrorType::OUTPUT, message) {}
};

} // namespace eshia
