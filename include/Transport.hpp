#pragma once

#include "Cancellation.hpp"
#include "HttpError.hpp"
#include "models.hpp"

namespace http_pipeline {

/**
 * Sends one prepared request and returns whatever the server answered, whatever the status.
 *
 * Implementations throw TransportException when no response could be obtained,
 * honor request.followRedirects and policy, and stop early once `cancellation` fires.
 * perform may be called concurrently from several calls.
 */
class Transport {
public:
	virtual ~Transport() = default;

	virtual HttpResponse perform(const HttpRequest& request, const RequestPolicy& policy,
		const CancellationToken& cancellation) = 0;
};

} // namespace http_pipeline
