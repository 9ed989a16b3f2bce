#pragma once

#include "HttpError.hpp"
#include "Interceptor.hpp"
#include "Transport.hpp"
#include "models.hpp"

#include <optional>

namespace http_pipeline {

/**
 * Result of a single pass through the interceptor chain.
 */
struct AttemptOutcome {
	enum State : uint8_t { Success, Retry, RetryAfter, Fatal };

	State state = Success;
	std::optional<HttpResponse> response;	// Success
	double delay = 0;						// RetryAfter, in seconds
	std::optional<HttpError> error;			// Fatal

	static AttemptOutcome success(HttpResponse response) { return {Success, std::move(response), 0, std::nullopt}; }
	static AttemptOutcome retry() { return {Retry, std::nullopt, 0, std::nullopt}; }
	static AttemptOutcome retryAfter(double seconds) { return {RetryAfter, std::nullopt, seconds, std::nullopt}; }
	static AttemptOutcome fatal(HttpError error) { return {Fatal, std::nullopt, 0, std::move(error)}; }
};

/**
 * Runs one call through the chain: prepare in list order, transport,
 * handle/process in reverse list order, classification, and the retry loop around it.
 * Holds references only; the owning client outlives it.
 */
class Pipeline {
public:
	Pipeline(Transport& transport, const Interceptors& interceptors, const Observers& observers,
		const HttpClientOptions& options);

	// Retry loop. Returns the classified-successful response or throws HttpError.
	HttpResponse execute(Context& context) const;

	// One attempt, never throws
	AttemptOutcome attempt(const Context& context) const;

private:
	static AttemptOutcome fromEvaluation(const Evaluation& evaluation);
	static AttemptOutcome classify(HttpResponse response);

	void notifyPrepared(const HttpRequest& request, const Context& context) const;
	void notifyEncountered(const HttpError& error, const Context& context) const;
	void notifyReceived(const HttpResponse& response, const Context& context) const;

	Transport& transport_;
	const Interceptors& interceptors_;
	const Observers& observers_;
	const HttpClientOptions& options_;
};

} // namespace http_pipeline
