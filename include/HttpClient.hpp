#pragma once

#include "Cancellation.hpp"
#include "Codec.hpp"
#include "HttpError.hpp"
#include "Interceptor.hpp"
#include "Transport.hpp"
#include "models.hpp"

#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <type_traits>

namespace http_pipeline {

/**
 * Sends requests through the interceptor chain and retry loop.
 *
 * Client interceptors always run before per-call ones when preparing, and after them
 * when handling errors and processing responses. All members are read-only after
 * construction, so one client serves concurrent calls from any number of threads.
 */
class HttpClient {
public:
	/**
	 * Handle on a call running on its own task.
	 * future.get() returns the response or rethrows the call's HttpError.
	 */
	class PendingCall {
	public:
		std::shared_future<HttpResponse> future;

		void cancel() { source_.cancel(); }
		bool isCancelled() const { return source_.isCancelled(); }

	private:
		PendingCall() = default;

		CancellationSource source_;

		friend class HttpClient;
	};

	explicit HttpClient(std::shared_ptr<Transport> transport,
		Interceptors interceptors = {},
		Observers observers = {},
		HttpClientOptions options = HttpClientOptions::getDefault(),
		CodecRegistry codecs = CodecRegistry::withDefaults());

	HttpClient(const HttpClient&) = delete;
	HttpClient& operator=(const HttpClient&) = delete;

	// Low level: the request goes out as given, apart from what interceptors change
	HttpResponse send(const HttpRequest& request,
		const Interceptors& interceptors = {},
		const Tags& tags = {},
		const CancellationToken& cancellation = {}) const;

	// send() on a task of its own. The client must outlive the returned call.
	std::shared_ptr<PendingCall> submit(HttpRequest request, Interceptors interceptors = {}, Tags tags = {}) const;

	/**
	 * Typed call: encodes payload, derives Content-Type/Accept from the payload and parser
	 * MIME types, sends, then parses the response.
	 */
	template <typename T>
	T fetch(const std::string& url, const std::string& method, const Payload& payload, const ResponseParser<T>& parser,
		const Interceptors& interceptors = {}, const Tags& tags = {}, const CancellationToken& cancellation = {}) const {
		HttpResponse response = this->send(this->buildRequest(url, method, payload, parser.mimeType), interceptors, tags, cancellation);
		return this->parse(response, parser);
	}

	// Like fetch, but a status in emptyStatusCodes yields std::nullopt without decoding the body
	template <typename T>
	std::optional<T> fetch(const std::string& url, const std::string& method, const Payload& payload,
		const ResponseParser<T>& parser, const std::set<long>& emptyStatusCodes,
		const Interceptors& interceptors = {}, const Tags& tags = {}, const CancellationToken& cancellation = {}) const {
		static_assert(!std::is_void<T>::value, "Use the fetch overload without emptyStatusCodes for ResponseParser<void>");

		HttpResponse response = this->send(this->buildRequest(url, method, payload, parser.mimeType), interceptors, tags, cancellation);
		if (emptyStatusCodes.count(response.status))
			return std::nullopt;
		return this->parse(response, parser);
	}

	const HttpClientOptions& options() const { return options_; }
	const CodecRegistry& codecs() const { return codecs_; }

private:
	// Throws HttpError(EncodingError)
	HttpRequest buildRequest(const std::string& url, const std::string& method, const Payload& payload,
		const std::optional<MimeType>& accept) const;

	template <typename T>
	T parse(const HttpResponse& response, const ResponseParser<T>& parser) const {
		try {
			return parser.parse(response, this->codecs_);
		} catch (const HttpError&) {
			throw;
		} catch (...) {
			throw HttpError::decodingError(std::current_exception());
		}
	}

	std::shared_ptr<Transport> transport_;
	const Interceptors interceptors_;
	const Observers observers_;
	const HttpClientOptions options_;
	const CodecRegistry codecs_;
};

} // namespace http_pipeline
