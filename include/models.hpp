#pragma once

#include "utils.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace http_pipeline {

struct RequestPolicy {
	float timeout = 0;		// optional per-request timeout in seconds (<=0 means wait indefinitely)
	float connTimeout = 0;	// optional connection (DNS + handshake) timeout in seconds (<=0 means default 300 second)

	uint32_t lowSpeedLimit = 0;	// in bytes
	uint32_t lowSpeedTime = 0;	// in seconds
	uint32_t sendSpeedLimit = 0;	// bytes per second
	uint32_t recvSpeedLimit = 0;	// bytes per second

	uint32_t curlBufferSize = 0; // in bytes, 0 keeps the transport default
};

struct HttpClientOptions {
	uint32_t maxRetryCount = 5;		// Retries after the first attempt, not counting it
	float timeout = 30;				// Per-transfer timeout in seconds, handed to the transport

	RequestPolicy transferPolicy;	// Remaining transport tuning, its timeout is overridden by `timeout`

	static const HttpClientOptions& getDefault() {
		static HttpClientOptions defaultOptions;
		return defaultOptions;
	}

	RequestPolicy requestPolicy() const {
		RequestPolicy policy = this->transferPolicy;
		policy.timeout = this->timeout;
		return policy;
	}
};

// Fuck you, <winnt.h>
#ifdef _WIN32
#ifdef DELETE
#undef DELETE
#endif
#endif

struct MimeType {
	std::string rawValue;

	static MimeType json() { return MimeType{"application/json"}; }
	static MimeType text() { return MimeType{"text/plain"}; }
	static MimeType octetStream() { return MimeType{"application/octet-stream"}; }

	// "Application/JSON; charset=utf-8" -> "application/json"
	std::string essence() const {
		std::string_view sv(this->rawValue);
		auto semicolon = sv.find(';');
		if (semicolon != std::string_view::npos)
			sv = sv.substr(0, semicolon);
		return util::tolower(util::trim(sv));
	}

	bool operator==(const MimeType& other) const { return this->essence() == other.essence(); }
	bool operator!=(const MimeType& other) const { return !(*this == other); }
};

struct Header {
	std::string name;
	std::string value;

	static Header contentType(const MimeType& mimeType) { return {"Content-Type", mimeType.rawValue}; }
	static Header accept(const MimeType& mimeType) { return {"Accept", mimeType.rawValue}; }
	static Header userAgent(std::string value) { return {"User-Agent", std::move(value)}; }
	static Header authorization(std::string value) { return {"Authorization", std::move(value)}; }

	bool operator==(const Header& other) const { return name == other.name && value == other.value; }
};

using Headers = std::vector<Header>;
using Tags = std::map<std::string, std::string>;

// Case-insensitive lookup, first match wins
inline std::optional<std::string> findHeader(const Headers& headers, std::string_view name) {
	for (const auto& header : headers)
		if (util::iequals(header.name, name))
			return header.value;
	return std::nullopt;
}

// Replaces every header named `name` (case-insensitive) by a single one, at the position of the first
inline void setHeader(Headers& headers, std::string_view name, std::string value) {
	bool replaced = false;
	for (auto it = headers.begin(); it != headers.end();) {
		if (!util::iequals(it->name, name)) {
			++it;
			continue;
		}
		if (!replaced) {
			it->value = std::move(value);
			replaced = true;
			++it;
		} else {
			it = headers.erase(it);
		}
	}
	if (!replaced)
		headers.push_back(Header{std::string(name), std::move(value)});
}

struct HttpRequest {
public:
#define HTTP_METHODS                                                                                                   \
	HTTP_METHOD(GET)                                                                                                   \
	HTTP_METHOD(POST)                                                                                                  \
	HTTP_METHOD(HEAD)                                                                                                  \
	HTTP_METHOD(PATCH)                                                                                                 \
	HTTP_METHOD(PUT)                                                                                                   \
	HTTP_METHOD(DELETE)

	enum Method : uint8_t {
#define HTTP_METHOD(methodName) methodName,
		HTTP_METHODS
#undef HTTP_METHOD
			OTHER = 255
	};
	static constexpr std::string_view MethodStr[] = {
#define HTTP_METHOD(methodName) #methodName,
		HTTP_METHODS
#undef HTTP_METHOD
	};
	static Method method2Enum(const std::string& methodName) {
#define HTTP_METHOD(name)                                                                                              \
	if (util::toupper(methodName) == #name) {                                                                          \
		return Method::name;                                                                                           \
	}
		HTTP_METHODS
#undef HTTP_METHOD

		return Method::OTHER;
	};

	std::string url;
	std::string methodName = "GET";
	Headers headers;				  // ordered, duplicates allowed
	std::optional<std::string> body;
	bool followRedirects = true;

	std::optional<std::string> headerValue(std::string_view name) const { return findHeader(this->headers, name); }
	void setHeader(std::string_view name, std::string value) { http_pipeline::setHeader(this->headers, name, std::move(value)); }
};

struct TransferInfo {
	// In second
	float startAt = std::chrono::duration<float>(
		std::chrono::system_clock::now().time_since_epoch()).count();
	float connect = 0, appConnect = 0, startTransfer = 0, total = 0, redir = 0;
	float completeAt = 0;
};

struct HttpResponse {
	long status = 0;

	Headers headers;
	std::string body;

	TransferInfo transferInfo;

	std::optional<std::string> headerValue(std::string_view name) const { return findHeader(this->headers, name); }
	void setHeader(std::string_view name, std::string value) { http_pipeline::setHeader(this->headers, name, std::move(value)); }
};

} // namespace http_pipeline
