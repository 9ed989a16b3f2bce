#pragma once

#include "Transport.hpp"
#include "models.hpp"

#include <cstddef>
#include <string>

#ifdef __cplusplus
extern "C" {
#endif
#include <curl/curl.h>
#ifdef __cplusplus
}
#endif

namespace http_pipeline {

struct CurlTransportSettings {
	long maxRedirects = 10;			// Only used when the request follows redirects
	bool tcpKeepAlive = true;
	std::string userAgent;			// Empty keeps libcurl's default
	std::string caInfo;				// Path to a CA bundle, empty keeps the system default
	bool verbose = false;

	static const CurlTransportSettings& getDefault();
	void applyCurlEasySettings(CURL* handle) const;
};

/**
 * Blocking libcurl transport. Every perform() owns its own easy handle,
 * so one instance serves concurrent calls.
 */
class CurlTransport : public Transport {
public:
	CurlTransport();
	explicit CurlTransport(CurlTransportSettings settings);

	HttpResponse perform(const HttpRequest& request, const RequestPolicy& policy,
		const CancellationToken& cancellation) override;

	const CurlTransportSettings& settings() const { return settings_; }

private:
	CurlTransportSettings settings_;
};

/**
 * A single exchange on a curl easy handle.
 * Neither copyable nor moveable: curl keeps pointers into it.
 */
class HttpTransfer {
public:
	HttpTransfer(const HttpRequest& request, const RequestPolicy& policy, const CurlTransportSettings& settings,
		CancellationToken cancellation);
	~HttpTransfer();

	HttpTransfer(const HttpTransfer&) = delete;
	HttpTransfer& operator=(const HttpTransfer&) = delete;
	HttpTransfer(HttpTransfer&&) = delete;
	HttpTransfer& operator=(HttpTransfer&&) = delete;

	// Throws TransportException when curl_easy_perform fails
	void perform_blocking();

	HttpResponse detachResponse();

private:
	void setup(const HttpRequest& request, const RequestPolicy& policy, const CurlTransportSettings& settings);
	void finalize_transfer();

	static size_t body_cb(void* ptr, size_t size, size_t nmemb, void* data);
	static size_t header_cb(void* ptr, size_t size, size_t nmemb, void* data);
	static int progress_cb(void* data, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow);

	CURL* curlEasy = nullptr;
	struct curl_slist* headers_ = nullptr;
	std::string method_;
	std::string body_;
	size_t contentLength = 0;
	char errorBuffer_[CURL_ERROR_SIZE] = {0};
	HttpResponse response;
	CancellationToken cancellation_;
};

} // namespace http_pipeline
