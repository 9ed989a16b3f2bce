#include "Pipeline.hpp"
#include "Status.hpp"

#include <exception>

#include <spdlog/spdlog.h>

namespace http_pipeline {

Pipeline::Pipeline(Transport& transport, const Interceptors& interceptors, const Observers& observers,
	const HttpClientOptions& options)
	: transport_(transport), interceptors_(interceptors), observers_(observers), options_(options) {}

HttpResponse Pipeline::execute(Context& context) const {
	const HttpRequest& request = context.request;

	while (true) {
		spdlog::debug("{} {} attempt {}", request.methodName, request.url, context.retryCount + 1);

		AttemptOutcome outcome = this->attempt(context);

		switch (outcome.state) {
			case AttemptOutcome::Success:
				return std::move(*outcome.response);

			case AttemptOutcome::Fatal:
				throw std::move(*outcome.error);

			case AttemptOutcome::Retry:
			case AttemptOutcome::RetryAfter: {
				if (context.retryCount >= this->options_.maxRetryCount) {
					spdlog::warn("{} {} gave up after {} attempts", request.methodName, request.url, context.retryCount + 1);
					throw HttpError::maxRetryCountReached(this->options_.maxRetryCount);
				}

				if (outcome.state == AttemptOutcome::RetryAfter) {
					spdlog::debug("{} {} retrying in {:.3f}s", request.methodName, request.url, outcome.delay);
					if (!context.cancellation.sleepFor(outcome.delay))
						throw HttpError::canceled();
				}

				if (context.isCancelled())
					throw HttpError::canceled();

				++context.retryCount;
				break;
			}
		}
	}
}

AttemptOutcome Pipeline::attempt(const Context& context) const {
	// Every attempt starts from the caller's request, so prepare can refresh volatile headers
	HttpRequest request = context.request;

	for (const auto& interceptor : this->interceptors_) {
		if (context.isCancelled())
			return AttemptOutcome::fatal(HttpError::canceled());

		try {
			interceptor->prepare(request, context);
		} catch (...) {
			return AttemptOutcome::fatal(HttpError::preparationError(std::current_exception()));
		}
	}

	if (context.isCancelled())
		return AttemptOutcome::fatal(HttpError::canceled());

	this->notifyPrepared(request, context);

	HttpResponse response;
	std::optional<HttpError> transportError;
	try {
		response = this->transport_.perform(request, this->options_.requestPolicy(), context.cancellation);
	} catch (const TransportException& e) {
		transportError = HttpError::transportError(std::current_exception(), e.code());
	} catch (...) {
		transportError = HttpError::transportError(std::current_exception());
	}

	if (context.isCancelled())
		return AttemptOutcome::fatal(HttpError::canceled());

	if (transportError) {
		spdlog::debug("{} {} transport error: {}", request.methodName, request.url, transportError->what());
		this->notifyEncountered(*transportError, context);

		// Per-call interceptors sit last in the list, they get the first word
		for (auto it = this->interceptors_.rbegin(); it != this->interceptors_.rend(); ++it) {
			if (context.isCancelled())
				return AttemptOutcome::fatal(HttpError::canceled());

			Evaluation evaluation;
			try {
				evaluation = (*it)->handle(*transportError, context);
			} catch (...) {
				return AttemptOutcome::fatal(HttpError::processingError(std::current_exception()));
			}

			if (context.isCancelled())
				return AttemptOutcome::fatal(HttpError::canceled());

			if (!evaluation.isProceed())
				return fromEvaluation(evaluation);
		}

		return AttemptOutcome::fatal(std::move(*transportError));
	}

	this->notifyReceived(response, context);

	for (auto it = this->interceptors_.rbegin(); it != this->interceptors_.rend(); ++it) {
		if (context.isCancelled())
			return AttemptOutcome::fatal(HttpError::canceled());

		Evaluation evaluation;
		try {
			evaluation = (*it)->process(response, context);
		} catch (...) {
			return AttemptOutcome::fatal(HttpError::processingError(std::current_exception()));
		}

		if (context.isCancelled())
			return AttemptOutcome::fatal(HttpError::canceled());

		if (!evaluation.isProceed())
			return fromEvaluation(evaluation);
	}

	return classify(std::move(response));
}

AttemptOutcome Pipeline::fromEvaluation(const Evaluation& evaluation) {
	if (evaluation.action == Evaluation::RetryAfter)
		return AttemptOutcome::retryAfter(evaluation.delay);
	return AttemptOutcome::retry();
}

AttemptOutcome Pipeline::classify(HttpResponse response) {
	switch (http_pipeline::classify(response.status)) {
		case StatusClass::Success:
		case StatusClass::Redirection:
			return AttemptOutcome::success(std::move(response));
		case StatusClass::ClientError:
			return AttemptOutcome::fatal(HttpError::clientError(std::move(response)));
		case StatusClass::ServerError:
			return AttemptOutcome::fatal(HttpError::serverError(std::move(response)));
		default:
			return AttemptOutcome::fatal(HttpError::unexpectedStatus(std::move(response)));
	}
}

void Pipeline::notifyPrepared(const HttpRequest& request, const Context& context) const {
	for (const auto& observer : this->observers_) {
		try {
			observer->didPrepare(request, context);
		} catch (const std::exception& e) {
			spdlog::warn("Observer failed in didPrepare: {}", e.what());
		} catch (...) {
			spdlog::warn("Observer failed in didPrepare: {}", describe(std::current_exception()));
		}
	}
}

void Pipeline::notifyEncountered(const HttpError& error, const Context& context) const {
	for (const auto& observer : this->observers_) {
		try {
			observer->didEncounter(error, context);
		} catch (const std::exception& e) {
			spdlog::warn("Observer failed in didEncounter: {}", e.what());
		} catch (...) {
			spdlog::warn("Observer failed in didEncounter: {}", describe(std::current_exception()));
		}
	}
}

void Pipeline::notifyReceived(const HttpResponse& response, const Context& context) const {
	for (const auto& observer : this->observers_) {
		try {
			observer->didReceive(response, context);
		} catch (const std::exception& e) {
			spdlog::warn("Observer failed in didReceive: {}", e.what());
		} catch (...) {
			spdlog::warn("Observer failed in didReceive: {}", describe(std::current_exception()));
		}
	}
}

} // namespace http_pipeline
