#pragma once

#include "Interceptor.hpp"
#include "RetryPolicy.hpp"
#include "RetryStrategies.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace http_pipeline {

// Sets fixed headers on every attempt, replacing same-named ones
class HeaderInterceptor : public Interceptor {
public:
	explicit HeaderInterceptor(Headers headers);

	void prepare(HttpRequest& request, const Context& context) override;

private:
	const Headers headers_;
};

/**
 * Opt-in retry. Transport failures and responses are turned into an AttemptRecord
 * and voted on by the RetryPolicy. A numeric Retry-After header wins over the backoff
 * when the policy honors it.
 * Retries still end at HttpClientOptions::maxRetryCount.
 */
class RetryInterceptor : public Interceptor {
public:
	explicit RetryInterceptor(RetryPolicy policy = RetryPolicy());

	Evaluation handle(const HttpError& transportError, const Context& context) override;
	Evaluation process(HttpResponse& response, const Context& context) override;

	static constexpr uint64_t maxRetryAfterSeconds = 24 * 60 * 60;

	// "120" -> 120, capped at maxRetryAfterSeconds. HTTP-dates and garbage yield std::nullopt
	static std::optional<double> retryAfterSeconds(const Headers& headers);

private:
	Evaluation evaluate(const AttemptRecord& record) const;

	const RetryPolicy policy_;
};

/**
 * Signs every attempt with a shared secret:
 *   X-Timestamp: <unix seconds>
 *   X-Signature: base64(HMAC-SHA256(secret, method \n url \n timestamp \n hex(SHA256(body))))
 * Both headers are recomputed on retries.
 */
class HmacSigningInterceptor : public Interceptor {
public:
	using Clock = std::function<double()>;

	explicit HmacSigningInterceptor(std::string secret, Clock clock = util::current_time);

	void prepare(HttpRequest& request, const Context& context) override;

	static std::string canonicalString(const HttpRequest& request, const std::string& timestamp);

private:
	const std::string secret_;
	const Clock clock_;
};

enum class AuthenticationScheme : uint8_t {
	None,
	DPoP,				// DPoP: <proof>
	AccessToken,		// Authorization: Bearer <token>
	DPoPAndAccessToken	// DPoP: <proof>, Authorization: DPoP <token>
};

// Source of credentials for AuthenticationInterceptor. Called from any thread
class TrustProvider {
public:
	virtual ~TrustProvider() = default;

	virtual std::optional<std::string> accessToken() = 0;

	// DPoP proof for the request as prepared so far
	virtual std::string sign(const HttpRequest& request) = 0;
};

/**
 * Adds authentication headers for a scheme. Without an access token the
 * token schemes leave the request untouched. A throwing provider fails the call with PreparationError.
 */
class AuthenticationInterceptor : public Interceptor {
public:
	AuthenticationInterceptor(std::shared_ptr<TrustProvider> provider, AuthenticationScheme scheme);

	void prepare(HttpRequest& request, const Context& context) override;

private:
	const std::shared_ptr<TrustProvider> provider_;
	const AuthenticationScheme scheme_;
};

// Logs every observer event through a spdlog logger, the default logger when none is given
class LoggingObserver : public Observer {
public:
	explicit LoggingObserver(std::shared_ptr<spdlog::logger> logger = nullptr,
		spdlog::level::level_enum level = spdlog::level::info);

	void didPrepare(const HttpRequest& request, const Context& context) override;
	void didEncounter(const HttpError& transportError, const Context& context) override;
	void didReceive(const HttpResponse& response, const Context& context) override;

private:
	spdlog::logger& logger() const;

	const std::shared_ptr<spdlog::logger> logger_;
	const spdlog::level::level_enum level_;
};

} // namespace http_pipeline
