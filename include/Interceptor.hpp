#pragma once

#include "Cancellation.hpp"
#include "Codec.hpp"
#include "HttpError.hpp"
#include "models.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace http_pipeline {

/**
 * Per-call state, created fresh by the client for every send/fetch and
 * threaded through all attempts of that call.
 */
struct Context {
	HttpRequest request;							// The request as built by the caller, before any prepare step
	Tags tags;										// Free-form per-call tags
	uint32_t retryCount = 0;						// 0 on the first attempt, +1 per retry
	const CodecRegistry* codecs = nullptr;			// The client's codecs
	CancellationToken cancellation;

	bool isCancelled() const { return cancellation.isCancelled(); }
};

/**
 * An interceptor's verdict on a transport error or a received response.
 */
struct Evaluation {
	enum Action : uint8_t { Proceed, Retry, RetryAfter };

	Action action = Proceed;
	double delay = 0;	// In seconds, only meaningful for RetryAfter

	static Evaluation proceed() { return {Proceed, 0}; }
	static Evaluation retry() { return {Retry, 0}; }
	static Evaluation retryAfter(double seconds) { return {RetryAfter, seconds}; }

	bool isProceed() const { return action == Proceed; }
};

/**
 * A pluggable pipeline participant.
 *
 * prepare runs in list order before the transport call,
 * handle (transport failures only) and process (every received response) run in reverse list order.
 * The first Retry/RetryAfter vote of an attempt ends that attempt.
 *
 * One instance may serve concurrent calls: guard any internal state.
 */
class Interceptor {
public:
	virtual ~Interceptor() = default;

	// Throwing fails the call with PreparationError
	virtual void prepare(HttpRequest& request, const Context& context) {}

	virtual Evaluation handle(const HttpError& transportError, const Context& context) {
		return Evaluation::proceed();
	}

	// May rewrite status, headers and body. Throwing fails the call with ProcessingError
	virtual Evaluation process(HttpResponse& response, const Context& context) {
		return Evaluation::proceed();
	}
};

/**
 * A notification sink. Never influences the outcome of a call,
 * exceptions thrown from it are logged and dropped.
 */
class Observer {
public:
	virtual ~Observer() = default;

	virtual void didPrepare(const HttpRequest& request, const Context& context) {}
	virtual void didEncounter(const HttpError& transportError, const Context& context) {}
	virtual void didReceive(const HttpResponse& response, const Context& context) {}
};

using Interceptors = std::vector<std::shared_ptr<Interceptor>>;
using Observers = std::vector<std::shared_ptr<Observer>>;

} // namespace http_pipeline
