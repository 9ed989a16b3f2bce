#pragma once

#include "models.hpp"

#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace http_pipeline {

class CodecRegistry;
template <typename T> struct ResponseParser;

// To add a new failure kind, just add a line here
#define HTTP_ERROR_KINDS(HTTP_ERROR_KIND) \
	HTTP_ERROR_KIND(EncodingError) \
	HTTP_ERROR_KIND(DecodingError) \
	HTTP_ERROR_KIND(PreparationError) \
	HTTP_ERROR_KIND(ProcessingError) \
	HTTP_ERROR_KIND(TransportError) \
	HTTP_ERROR_KIND(ClientError) \
	HTTP_ERROR_KIND(ServerError) \
	HTTP_ERROR_KIND(UnexpectedStatus) \
	HTTP_ERROR_KIND(UnexpectedResponse) \
	HTTP_ERROR_KIND(MaxRetryCountReached) \
	HTTP_ERROR_KIND(Canceled)

/**
 * Thrown by the transport when the request could not be exchanged at all
 * (DNS, connect, TLS, send/receive, aborted transfer).
 * `code` is transport specific, the CURLcode for CurlTransport.
 */
class TransportException : public std::runtime_error {
public:
	TransportException(int code, const std::string& message)
		: std::runtime_error(message), code_(code) {}

	int code() const noexcept { return code_; }

private:
	int code_;
};

/**
 * The single error type escaping HttpClient::send and HttpClient::fetch.
 * Exactly one Kind per failed call. Status classifications carry the full response,
 * boundary failures carry the original exception as cause.
 */
class HttpError : public std::runtime_error {
public:
	enum class Kind : uint8_t {
#define HTTP_ERROR_KIND(name) name,
		HTTP_ERROR_KINDS(HTTP_ERROR_KIND)
#undef HTTP_ERROR_KIND
	};
	static constexpr std::string_view KindStr[] = {
#define HTTP_ERROR_KIND(name) #name,
		HTTP_ERROR_KINDS(HTTP_ERROR_KIND)
#undef HTTP_ERROR_KIND
	};

	static HttpError encodingError(std::exception_ptr cause);
	static HttpError decodingError(std::exception_ptr cause);
	static HttpError preparationError(std::exception_ptr cause);
	static HttpError processingError(std::exception_ptr cause);
	static HttpError transportError(std::exception_ptr cause, int transportCode = 0);
	static HttpError clientError(HttpResponse response);
	static HttpError serverError(HttpResponse response);
	static HttpError unexpectedStatus(HttpResponse response);
	static HttpError unexpectedResponse(HttpResponse response);
	static HttpError maxRetryCountReached(uint32_t maxRetryCount);
	static HttpError canceled();

	Kind kind() const noexcept { return kind_; }
	bool is(Kind kind) const noexcept { return kind_ == kind; }
	std::string_view kindName() const noexcept { return KindStr[static_cast<size_t>(kind_)]; }

	// The response carried by ClientError, ServerError, UnexpectedStatus and UnexpectedResponse
	const std::optional<HttpResponse>& response() const noexcept { return response_; }

	// The original exception, for boundary failures
	std::exception_ptr cause() const noexcept { return cause_; }

	// TransportException::code() of the cause, 0 when there is none
	int transportCode() const noexcept { return transportCode_; }

	// Run a parser over the carried response, skipping its status expectation.
	// Throws std::logic_error when no response is carried.
	template <typename T>
	T parsed(const ResponseParser<T>& parser, const CodecRegistry& codecs) const;

private:
	HttpError(Kind kind, std::string message, std::exception_ptr cause, std::optional<HttpResponse> response,
		int transportCode = 0);

	Kind kind_;
	int transportCode_;
	std::exception_ptr cause_;
	std::optional<HttpResponse> response_;
};

// what() of an exception_ptr, "unknown error" for non-std exceptions
std::string describe(std::exception_ptr error);

} // namespace http_pipeline
