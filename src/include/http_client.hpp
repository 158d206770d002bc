#pragma once

#include <string>
#include <curl/curl.h>

namespace eshia {

struct HttpResponse {
	int status_code = 0;
	std::string body;
	std::string content_type;
	std::string error;
	bool success = false;
};

struct HttpRequestOptions {
	std::string user_agent;
	std::string accept_language;
	double timeout_seconds = 30.0;
};

// Initialize libcurl globals (call once before the first request)
void InitializeHttpClient();
// Cleanup libcurl globals (call once after the last request)
void CleanupHttpClient();

// Blocking HTTP GET over one reused curl easy handle.
// The handle keeps the connection alive between sequential page requests.
class HttpClient {
public:
	HttpClient();
	~HttpClient();

	// Disable copy/move
	HttpClient(const HttpClient&) = delete;
	HttpClient& operator=(const HttpClient&) = delete;

	HttpResponse Get(const std::string &url, const HttpRequestOptions &options);

private:
	CURL *handle_;
};

} // namespace eshia
