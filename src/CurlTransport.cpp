#include "CurlTransport.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <string_view>

#include <spdlog/spdlog.h>

namespace http_pipeline {

// CurlTransportSettings implementation
const CurlTransportSettings& CurlTransportSettings::getDefault() {
	static CurlTransportSettings defaultSettings;
	return defaultSettings;
}

void CurlTransportSettings::applyCurlEasySettings(CURL* handle) const {
#if LIBCURL_VERSION_NUM >= 0x075700
	curl_easy_setopt(handle, CURLOPT_CA_CACHE_TIMEOUT, 604800L);
#endif
	curl_easy_setopt(handle, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_NONE);
	curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
	curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(handle, CURLOPT_TCP_KEEPALIVE, this->tcpKeepAlive ? 1L : 0L);
	curl_easy_setopt(handle, CURLOPT_MAXREDIRS, this->maxRedirects);
	curl_easy_setopt(handle, CURLOPT_USE_SSL, CURLUSESSL_TRY);
	curl_easy_setopt(handle, CURLOPT_VERBOSE, this->verbose ? 1L : 0L);
	if (!this->userAgent.empty())
		curl_easy_setopt(handle, CURLOPT_USERAGENT, this->userAgent.c_str());
	if (!this->caInfo.empty())
		curl_easy_setopt(handle, CURLOPT_CAINFO, this->caInfo.c_str());
}

// HttpTransfer implementation
HttpTransfer::HttpTransfer(const HttpRequest& request, const RequestPolicy& policy,
	const CurlTransportSettings& settings, CancellationToken cancellation)
	: cancellation_(std::move(cancellation)) {
	static std::once_flag inited;

	std::call_once(inited, []() {
		auto rc = curl_global_init(CURL_GLOBAL_DEFAULT);
		if (rc != CURLE_OK) throw std::runtime_error("curl_global_init failed");
		std::atexit([]{ curl_global_cleanup(); });
	});

	this->curlEasy = curl_easy_init();
	if (!this->curlEasy)
		throw TransportException(CURLE_FAILED_INIT, "curl_easy_init failed");

	try {
		this->setup(request, policy, settings);
	} catch (...) {
		curl_slist_free_all(this->headers_);
		curl_easy_cleanup(this->curlEasy);
		throw;
	}
}

HttpTransfer::~HttpTransfer() {
	curl_easy_cleanup(this->curlEasy);
	curl_slist_free_all(this->headers_);
}

HttpResponse HttpTransfer::detachResponse() {
	return std::move(this->response);
}

void HttpTransfer::setup(const HttpRequest& request, const RequestPolicy& policy, const CurlTransportSettings& settings) {
	settings.applyCurlEasySettings(this->curlEasy);

	curl_easy_setopt(this->curlEasy, CURLOPT_URL, request.url.c_str());
	curl_easy_setopt(this->curlEasy, CURLOPT_FOLLOWLOCATION, request.followRedirects ? 1L : 0L);
	curl_easy_setopt(this->curlEasy, CURLOPT_ERRORBUFFER, this->errorBuffer_);

	if (policy.timeout > 0)
		curl_easy_setopt(this->curlEasy, CURLOPT_TIMEOUT_MS, static_cast<long>(policy.timeout * 1000));
	if (policy.connTimeout > 0)
		curl_easy_setopt(this->curlEasy, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(policy.connTimeout * 1000));
	if (policy.sendSpeedLimit)
		curl_easy_setopt(this->curlEasy, CURLOPT_MAX_SEND_SPEED_LARGE, static_cast<curl_off_t>(policy.sendSpeedLimit));
	if (policy.recvSpeedLimit)
		curl_easy_setopt(this->curlEasy, CURLOPT_MAX_RECV_SPEED_LARGE, static_cast<curl_off_t>(policy.recvSpeedLimit));
	if (policy.lowSpeedLimit && policy.lowSpeedTime) {
		curl_easy_setopt(this->curlEasy, CURLOPT_LOW_SPEED_TIME, static_cast<long>(policy.lowSpeedTime));
		curl_easy_setopt(this->curlEasy, CURLOPT_LOW_SPEED_LIMIT, static_cast<long>(policy.lowSpeedLimit));
	}
	if (policy.curlBufferSize) {
		long buf_size = std::clamp(policy.curlBufferSize, 1024u, static_cast<uint32_t>(CURL_MAX_READ_SIZE));
		curl_easy_setopt(this->curlEasy, CURLOPT_BUFFERSIZE, buf_size);
	}

	for (const auto& header : request.headers) {
		std::string line = header.value.empty() ? header.name + ";" : header.name + ": " + header.value;
		struct curl_slist* appended = curl_slist_append(this->headers_, line.c_str());
		if (!appended)
			throw TransportException(CURLE_OUT_OF_MEMORY, "curl_slist_append failed");
		this->headers_ = appended;
	}
	curl_easy_setopt(this->curlEasy, CURLOPT_HTTPHEADER, this->headers_);

	// curl keeps pointers to both
	this->method_ = util::toupper(request.methodName);
	this->body_ = request.body.value_or("");

	switch (HttpRequest::method2Enum(this->method_)) {
		case HttpRequest::HEAD: {
			curl_easy_setopt(this->curlEasy, CURLOPT_NOBODY, 1L);
			break;
		}
		case HttpRequest::GET: {
			curl_easy_setopt(this->curlEasy, CURLOPT_HTTPGET, 1L);
			break;
		}
		case HttpRequest::POST: {
			curl_easy_setopt(this->curlEasy, CURLOPT_POST, 1L);
			curl_easy_setopt(this->curlEasy, CURLOPT_POSTFIELDS, this->body_.c_str());
			curl_easy_setopt(this->curlEasy, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(this->body_.size()));
			break;
		}
		default: {
			curl_easy_setopt(this->curlEasy, CURLOPT_CUSTOMREQUEST, this->method_.c_str());
			if (request.body) {
				curl_easy_setopt(this->curlEasy, CURLOPT_POSTFIELDS, this->body_.c_str());
				curl_easy_setopt(this->curlEasy, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(this->body_.size()));
			}
		}
	}

	curl_easy_setopt(this->curlEasy, CURLOPT_WRITEFUNCTION, HttpTransfer::body_cb);
	curl_easy_setopt(this->curlEasy, CURLOPT_WRITEDATA, this);
	curl_easy_setopt(this->curlEasy, CURLOPT_HEADERFUNCTION, HttpTransfer::header_cb);
	curl_easy_setopt(this->curlEasy, CURLOPT_HEADERDATA, this);
	curl_easy_setopt(this->curlEasy, CURLOPT_XFERINFOFUNCTION, HttpTransfer::progress_cb);
	curl_easy_setopt(this->curlEasy, CURLOPT_XFERINFODATA, this);
}

void HttpTransfer::perform_blocking() {
	CURLcode rc = curl_easy_perform(this->curlEasy);
	if (rc != CURLE_OK) {
		std::string message = this->errorBuffer_[0] ? std::string(this->errorBuffer_) : curl_easy_strerror(rc);
		throw TransportException(rc, message);
	}
	this->finalize_transfer();
}

void HttpTransfer::finalize_transfer() {
	curl_easy_getinfo(this->curlEasy, CURLINFO_RESPONSE_CODE, &this->response.status);

	curl_off_t connect = 0, appConnect = 0, startTransfer = 0, total = 0, redir = 0;
	curl_easy_getinfo(this->curlEasy, CURLINFO_CONNECT_TIME_T, &connect);
	curl_easy_getinfo(this->curlEasy, CURLINFO_APPCONNECT_TIME_T, &appConnect);
	curl_easy_getinfo(this->curlEasy, CURLINFO_STARTTRANSFER_TIME_T, &startTransfer);
	curl_easy_getinfo(this->curlEasy, CURLINFO_TOTAL_TIME_T, &total);
	curl_easy_getinfo(this->curlEasy, CURLINFO_REDIRECT_TIME_T, &redir);

	constexpr float us2s = 1e-6f;
	this->response.transferInfo.connect = connect * us2s;
	this->response.transferInfo.appConnect = appConnect * us2s;
	this->response.transferInfo.startTransfer = startTransfer * us2s;
	this->response.transferInfo.total = total * us2s;
	this->response.transferInfo.redir = redir * us2s;

	this->response.transferInfo.completeAt = static_cast<float>(util::current_time());
}

size_t HttpTransfer::body_cb(void* ptr, size_t size, size_t nmemb, void* data) {
	HttpTransfer* transfer = static_cast<HttpTransfer*>(data);
	if (transfer->contentLength > transfer->response.body.capacity())
		transfer->response.body.reserve(transfer->contentLength);

	transfer->response.body.append(static_cast<char*>(ptr), size * nmemb);
	return size * nmemb;
}

size_t HttpTransfer::header_cb(void* ptr, size_t size, size_t nmemb, void* data) {
	HttpTransfer* transfer = static_cast<HttpTransfer*>(data);

	const size_t len = size * nmemb;
	if (!ptr || len == 0)
		return len;

	std::string_view sv(static_cast<const char*>(ptr), len);

	if (!sv.empty() && sv.back() == '\n')
		sv.remove_suffix(1);
	if (!sv.empty() && sv.back() == '\r')
		sv.remove_suffix(1);

	if (sv.empty())
		return len;

	// A new status line starts a new response (redirect hop or 100-continue): keep only the last one's headers
	if (sv.rfind("HTTP/", 0) == 0) {
		transfer->response.headers.clear();
		transfer->response.body.clear();
		transfer->contentLength = 0;
		return len;
	}

	auto colon = sv.find(':');
	if (colon == std::string_view::npos)
		return len;

	Header header{std::string(util::trim(sv.substr(0, colon))), std::string(util::trim(sv.substr(colon + 1)))};

	// Parse content-length for pre-allocation
	static const std::regex contentLengthRegex("^content-length$", std::regex::icase);
	if (std::regex_match(header.name, contentLengthRegex))
		transfer->contentLength = std::strtoul(header.value.c_str(), nullptr, 10);

	transfer->response.headers.push_back(std::move(header));
	return len;
}

int HttpTransfer::progress_cb(void* data, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
	HttpTransfer* transfer = static_cast<HttpTransfer*>(data);
	// Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
	return transfer->cancellation_.isCancelled() ? 1 : 0;
}

// CurlTransport implementation
CurlTransport::CurlTransport() : settings_(CurlTransportSettings::getDefault()) {}

CurlTransport::CurlTransport(CurlTransportSettings settings) : settings_(std::move(settings)) {}

HttpResponse CurlTransport::perform(const HttpRequest& request, const RequestPolicy& policy,
	const CancellationToken& cancellation) {
	HttpTransfer transfer(request, policy, this->settings_, cancellation);

	try {
		transfer.perform_blocking();
	} catch (const TransportException& e) {
		if (e.code() == CURLE_ABORTED_BY_CALLBACK)
			spdlog::debug("{} {} aborted by cancellation", request.methodName, request.url);
		else
			spdlog::error("{} {} failed: {} (CURLcode {})", request.methodName, request.url, e.what(), e.code());
		throw;
	}

	HttpResponse response = transfer.detachResponse();
	spdlog::debug("{} {} -> {} in {:.3f}s", request.methodName, request.url, response.status, response.transferInfo.total);
	return response;
}

} // namespace http_pipeline
