#include "http_client.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <utility>

namespace eshia {

void InitializeHttpClient() {
	curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CleanupHttpClient() {
	curl_global_cleanup();
}

HttpClient::HttpClient() : handle_(curl_easy_init()) {
}

HttpClient::~HttpClient() {
	if (handle_) {
		curl_easy_cleanup(handle_);
	}
}

// RAII wrapper for a request header list
class HeaderListGuard {
public:
	HeaderListGuard() = default;
	~HeaderListGuard() {
		if (list_) {
			curl_slist_free_all(list_);
		}
	}

	HeaderListGuard(const HeaderListGuard&) = delete;
	HeaderListGuard& operator=(const HeaderListGuard&) = delete;

	void Add(const std::string &name, const std::string &value) {
		std::string line = name + ": " + value;
		curl_slist *appended = curl_slist_append(list_, line.c_str());
		if (appended) {
			list_ = appended;
		}
	}

	curl_slist *get() const { return list_; }

private:
	curl_slist *list_ = nullptr;
};

// Everything one transfer delivers through the callbacks
struct ResponseSink {
	std::string body;
	std::string content_type;
};

static size_t OnBody(char *data, size_t size, size_t nmemb, void *userp) {
	auto *sink = static_cast<ResponseSink *>(userp);
	sink->body.append(data, size * nmemb);
	return size * nmemb;
}

// Header line value if its name matches (case-insensitive), trimmed
static bool MatchHeader(const char *line, size_t length, const char *name, std::string &value) {
	size_t name_length = strlen(name);
	if (length <= name_length || line[name_length] != ':') {
		return false;
	}
	for (size_t i = 0; i < name_length; i++) {
		if (std::tolower(static_cast<unsigned char>(line[i])) != name[i]) {
			return false;
		}
	}

	size_t start = name_length + 1;
	size_t end = length;
	while (start < end && std::isspace(static_cast<unsigned char>(line[start]))) {
		start++;
	}
	while (end > start && std::isspace(static_cast<unsigned char>(line[end - 1]))) {
		end--;
	}
	value.assign(line + start, end - start);
	return true;
}

static size_t OnHeader(char *line, size_t size, size_t nitems, void *userp) {
	auto *sink = static_cast<ResponseSink *>(userp);
	size_t length = size * nitems;

	// Every redirect hop starts with its own status line
	if (length >= 5 && strncmp(line, "HTTP/", 5) == 0) {
		sink->content_type.clear();
		return length;
	}

	std::string value;
	if (MatchHeader(line, length, "content-type", value)) {
		sink->content_type = value;
	}
	return length;
}

HttpResponse HttpClient::Get(const std::string &url, const HttpRequestOptions &options) {
	HttpResponse response;
	if (!handle_) {
		response.error = "Failed to acquire curl handle";
		return response;
	}

	// Same handle, fresh options: the connection cache survives the reset
	curl_easy_reset(handle_);

	ResponseSink sink;
	HeaderListGuard headers;
	if (!options.accept_language.empty()) {
		headers.Add("Accept-Language", options.accept_language);
	}

	long timeout_ms = std::max(1L, static_cast<long>(options.timeout_seconds * 1000.0));

	curl_easy_setopt(handle_, CURLOPT_URL, url.c_str());
	curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION, OnBody);
	curl_easy_setopt(handle_, CURLOPT_WRITEDATA, &sink);
	curl_easy_setopt(handle_, CURLOPT_HEADERFUNCTION, OnHeader);
	curl_easy_setopt(handle_, CURLOPT_HEADERDATA, &sink);
	if (!options.user_agent.empty()) {
		curl_easy_setopt(handle_, CURLOPT_USERAGENT, options.user_agent.c_str());
	}
	if (headers.get()) {
		curl_easy_setopt(handle_, CURLOPT_HTTPHEADER, headers.get());
	}
	curl_easy_setopt(handle_, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");
	curl_easy_setopt(handle_, CURLOPT_TIMEOUT_MS, timeout_ms);
	curl_easy_setopt(handle_, CURLOPT_CONNECTTIMEOUT_MS, std::min(timeout_ms, 10000L));
	curl_easy_setopt(handle_, CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(handle_, CURLOPT_MAXREDIRS, 10L);
	curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);

	CURLcode res = curl_easy_perform(handle_);

	// Header list is freed by the guard; drop the handle's pointer to it first
	curl_easy_setopt(handle_, CURLOPT_HTTPHEADER, static_cast<curl_slist *>(nullptr));

	if (res != CURLE_OK) {
		response.error = curl_easy_strerror(res);
		return response;
	}

	long status_code = 0;
	curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &status_code);

	response.status_code = static_cast<int>(status_code);
	response.body = std::move(sink.body);
	response.content_type = std::move(sink.content_type);
	response.success = response.status_code >= 200 && response.status_code < 300;
	if (!response.success) {
		response.error = "HTTP " + std::to_string(response.status_code);
	}
	return response;
}

} // namespace eshia
