#include "HttpClient.hpp"
#include "Pipeline.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace http_pipeline {

HttpClient::HttpClient(std::shared_ptr<Transport> transport, Interceptors interceptors, Observers observers,
	HttpClientOptions options, CodecRegistry codecs)
	: transport_(std::move(transport)),
	  interceptors_(std::move(interceptors)),
	  observers_(std::move(observers)),
	  options_(std::move(options)),
	  codecs_(std::move(codecs)) {
	if (!this->transport_)
		throw std::invalid_argument("HttpClient: null transport");
	for (const auto& interceptor : this->interceptors_)
		if (!interceptor) throw std::invalid_argument("HttpClient: null interceptor");
	for (const auto& observer : this->observers_)
		if (!observer) throw std::invalid_argument("HttpClient: null observer");
}

HttpResponse HttpClient::send(const HttpRequest& request, const Interceptors& interceptors, const Tags& tags,
	const CancellationToken& cancellation) const {
	// Per-call interceptors last: they prepare after, and evaluate before, the client ones
	Interceptors chain;
	chain.reserve(this->interceptors_.size() + interceptors.size());
	chain.insert(chain.end(), this->interceptors_.begin(), this->interceptors_.end());
	for (const auto& interceptor : interceptors) {
		if (!interceptor)
			throw HttpError::preparationError(std::make_exception_ptr(std::invalid_argument("HttpClient::send: null interceptor")));
		chain.push_back(interceptor);
	}

	Context context;
	context.request = request;
	context.tags = tags;
	context.retryCount = 0;
	context.codecs = &this->codecs_;
	context.cancellation = cancellation;

	Pipeline pipeline(*this->transport_, chain, this->observers_, this->options_);
	return pipeline.execute(context);
}

std::shared_ptr<HttpClient::PendingCall> HttpClient::submit(HttpRequest request, Interceptors interceptors, Tags tags) const {
	std::shared_ptr<PendingCall> call(new PendingCall());
	CancellationToken token = call->source_.token();

	call->future = std::async(std::launch::async,
		[this, request = std::move(request), interceptors = std::move(interceptors), tags = std::move(tags), token]() {
			return this->send(request, interceptors, tags, token);
		}).share();

	return call;
}

HttpRequest HttpClient::buildRequest(const std::string& url, const std::string& method, const Payload& payload,
	const std::optional<MimeType>& accept) const {
	HttpRequest request;
	request.url = url;
	request.methodName = method;

	try {
		request.body = payload.encode(this->codecs_);
	} catch (...) {
		throw HttpError::encodingError(std::current_exception());
	}

	if (payload.mimeType() && request.body)
		request.headers.push_back(Header::contentType(*payload.mimeType()));
	if (accept)
		request.headers.push_back(Header::accept(*accept));

	spdlog::debug("Built {} {} ({} body bytes)", request.methodName, request.url, request.body ? request.body->size() : 0);
	return request;
}

} // namespace http_pipeline
