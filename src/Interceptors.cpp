#include "Interceptors.hpp"
#include "HashHelper.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace http_pipeline {

HeaderInterceptor::HeaderInterceptor(Headers headers) : headers_(std::move(headers)) {}

void HeaderInterceptor::prepare(HttpRequest& request, const Context&) {
	for (const auto& header : this->headers_)
		request.setHeader(header.name, header.value);
}

RetryInterceptor::RetryInterceptor(RetryPolicy policy) : policy_(std::move(policy)) {
	if (!this->policy_.shouldRetry)
		throw std::invalid_argument("RetryInterceptor: empty shouldRetry");
}

Evaluation RetryInterceptor::handle(const HttpError& transportError, const Context& context) {
	AttemptRecord record;
	record.retryCount = context.retryCount;
	record.transportFailed = true;
	record.transportCode = transportError.transportCode();
	return this->evaluate(record);
}

Evaluation RetryInterceptor::process(HttpResponse& response, const Context& context) {
	AttemptRecord record;
	record.retryCount = context.retryCount;
	record.status = response.status;
	record.headers = response.headers;
	return this->evaluate(record);
}

Evaluation RetryInterceptor::evaluate(const AttemptRecord& record) const {
	if (!this->policy_.shouldRetry(record))
		return Evaluation::proceed();

	double delay = 0;
	std::optional<double> retryAfter;
	if (this->policy_.honorRetryAfter)
		retryAfter = retryAfterSeconds(record.headers);

	if (retryAfter)
		delay = *retryAfter;
	else if (this->policy_.getRetryDelay)
		delay = this->policy_.getRetryDelay(record);

	spdlog::debug("RetryInterceptor: retry {} (status {}, transport code {}) in {:.3f}s",
		record.retryCount + 1, record.status, record.transportCode, delay);

	if (delay > 0)
		return Evaluation::retryAfter(delay);
	return Evaluation::retry();
}

std::optional<double> RetryInterceptor::retryAfterSeconds(const Headers& headers) {
	auto value = findHeader(headers, "Retry-After");
	if (!value)
		return std::nullopt;

	std::string_view sv = util::trim(*value);
	if (sv.empty())
		return std::nullopt;

	uint64_t seconds = 0;
	auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), seconds);
	if (ptr != sv.data() + sv.size())
		return std::nullopt;
	if (ec == std::errc::result_out_of_range)
		return static_cast<double>(RetryInterceptor::maxRetryAfterSeconds);
	if (ec != std::errc())
		return std::nullopt;

	return static_cast<double>(std::min<uint64_t>(seconds, RetryInterceptor::maxRetryAfterSeconds));
}

HmacSigningInterceptor::HmacSigningInterceptor(std::string secret, Clock clock)
	: secret_(std::move(secret)), clock_(std::move(clock)) {
	if (this->secret_.empty())
		throw std::invalid_argument("HmacSigningInterceptor: empty secret");
	if (!this->clock_)
		throw std::invalid_argument("HmacSigningInterceptor: empty clock");
}

void HmacSigningInterceptor::prepare(HttpRequest& request, const Context&) {
	std::string timestamp = std::to_string(static_cast<long long>(std::floor(this->clock_())));
	std::string signature = base64::encode(Hmac::sha256(this->secret_, canonicalString(request, timestamp)));

	request.setHeader("X-Timestamp", timestamp);
	request.setHeader("X-Signature", std::move(signature));
}

std::string HmacSigningInterceptor::canonicalString(const HttpRequest& request, const std::string& timestamp) {
	std::string bodyHash = Hash::hexdigest(Hash::sha256(request.body ? *request.body : std::string()));

	std::string canonical;
	canonical.reserve(request.methodName.size() + request.url.size() + timestamp.size() + bodyHash.size() + 3);
	canonical.append(util::toupper(request.methodName)).append("\n");
	canonical.append(request.url).append("\n");
	canonical.append(timestamp).append("\n");
	canonical.append(bodyHash);
	return canonical;
}

AuthenticationInterceptor::AuthenticationInterceptor(std::shared_ptr<TrustProvider> provider, AuthenticationScheme scheme)
	: provider_(std::move(provider)), scheme_(scheme) {
	if (!this->provider_ && this->scheme_ != AuthenticationScheme::None)
		throw std::invalid_argument("AuthenticationInterceptor: null trust provider");
}

void AuthenticationInterceptor::prepare(HttpRequest& request, const Context&) {
	switch (this->scheme_) {
		case AuthenticationScheme::None:
			break;
		case AuthenticationScheme::DPoP:
			request.setHeader("DPoP", this->provider_->sign(request));
			break;
		case AuthenticationScheme::AccessToken:
			if (auto token = this->provider_->accessToken())
				request.setHeader("Authorization", "Bearer " + *token);
			break;
		case AuthenticationScheme::DPoPAndAccessToken:
			if (auto token = this->provider_->accessToken()) {
				std::string proof = this->provider_->sign(request);
				request.setHeader("DPoP", std::move(proof));
				request.setHeader("Authorization", "DPoP " + *token);
			}
			break;
	}
}

LoggingObserver::LoggingObserver(std::shared_ptr<spdlog::logger> logger, spdlog::level::level_enum level)
	: logger_(std::move(logger)), level_(level) {}

spdlog::logger& LoggingObserver::logger() const {
	if (this->logger_)
		return *this->logger_;
	return *spdlog::default_logger_raw();
}

void LoggingObserver::didPrepare(const HttpRequest& request, const Context& context) {
	this->logger().log(this->level_, "-> {} {} (retry {}, {} headers, {} body bytes)",
		request.methodName, request.url, context.retryCount, request.headers.size(),
		request.body ? request.body->size() : 0);
}

void LoggingObserver::didEncounter(const HttpError& transportError, const Context& context) {
	this->logger().log(this->level_, "!! {} {} (retry {}): {}",
		context.request.methodName, context.request.url, context.retryCount, transportError.what());
}

void LoggingObserver::didReceive(const HttpResponse& response, const Context& context) {
	this->logger().log(this->level_, "<- {} {} {} (retry {}, {} body bytes, {:.3f}s)",
		response.status, context.request.methodName, context.request.url, context.retryCount,
		response.body.size(), response.transferInfo.total);
}

} // namespace http_pipeline
