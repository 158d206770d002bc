#include "reader_exception.hpp"

namespace eshia {

const char* ReaderErrorTypeToString(ReaderErrorType type) {
	switch (type) {
		case ReaderErrorType::INVALID_PAGE_URL: return "invalid_page_url";
		case ReaderErrorType::TRANSPORT: return "transport_error";
		case ReaderErrorType::READER_NOT_FOUND: return "reader_not_found";
		case ReaderErrorType::ARGUMENT: return "argument_error";
		case ReaderErrorType::OUTPUT: return "output_error";
		default: return "unknown";
	}
}

} // namespace eshia
