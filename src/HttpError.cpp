#include "HttpError.hpp"

#include <utility>

namespace http_pipeline {

std::string describe(std::exception_ptr error) {
	if (!error)
		return "no error";
	try {
		std::rethrow_exception(error);
	} catch (const std::exception& e) {
		return e.what();
	} catch (...) {
		return "unknown error";
	}
}

static std::string statusMessage(std::string_view prefix, const HttpResponse& response) {
	return std::string(prefix) + " (status " + std::to_string(response.status) + ")";
}

HttpError::HttpError(Kind kind, std::string message, std::exception_ptr cause, std::optional<HttpResponse> response, int transportCode)
	: std::runtime_error(std::move(message)), kind_(kind), transportCode_(transportCode), cause_(std::move(cause)),
	  response_(std::move(response)) {}

HttpError HttpError::encodingError(std::exception_ptr cause) {
	return HttpError(Kind::EncodingError, "Failed to encode request payload: " + describe(cause), cause, std::nullopt);
}

HttpError HttpError::decodingError(std::exception_ptr cause) {
	return HttpError(Kind::DecodingError, "Failed to decode response body: " + describe(cause), cause, std::nullopt);
}

HttpError HttpError::preparationError(std::exception_ptr cause) {
	return HttpError(Kind::PreparationError, "Interceptor failed to prepare request: " + describe(cause), cause, std::nullopt);
}

HttpError HttpError::processingError(std::exception_ptr cause) {
	return HttpError(Kind::ProcessingError, "Interceptor failed to process response: " + describe(cause), cause, std::nullopt);
}

HttpError HttpError::transportError(std::exception_ptr cause, int transportCode) {
	return HttpError(Kind::TransportError, "Transport failed: " + describe(cause), cause, std::nullopt, transportCode);
}

HttpError HttpError::clientError(HttpResponse response) {
	auto message = statusMessage("Client error", response);
	return HttpError(Kind::ClientError, std::move(message), nullptr, std::move(response));
}

HttpError HttpError::serverError(HttpResponse response) {
	auto message = statusMessage("Server error", response);
	return HttpError(Kind::ServerError, std::move(message), nullptr, std::move(response));
}

HttpError HttpError::unexpectedStatus(HttpResponse response) {
	auto message = statusMessage("Unexpected status code", response);
	return HttpError(Kind::UnexpectedStatus, std::move(message), nullptr, std::move(response));
}

HttpError HttpError::unexpectedResponse(HttpResponse response) {
	auto message = statusMessage("Response did not match the expected status", response);
	return HttpError(Kind::UnexpectedResponse, std::move(message), nullptr, std::move(response));
}

HttpError HttpError::maxRetryCountReached(uint32_t maxRetryCount) {
	return HttpError(Kind::MaxRetryCountReached,
		"Max retry count reached (" + std::to_string(maxRetryCount) + ")", nullptr, std::nullopt);
}

HttpError HttpError::canceled() {
	return HttpError(Kind::Canceled, "The call was canceled", nullptr, std::nullopt);
}

} // namespace http_pipeline
