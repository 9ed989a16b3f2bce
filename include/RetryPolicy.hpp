#pragma once

#include "models.hpp"

#include <cstdint>
#include <functional>

namespace http_pipeline {

/**
 * What a retry decision gets to see about the attempt that just finished.
 * Either transportFailed is set, or status/headers come from a received response.
 */
struct AttemptRecord {
    uint32_t retryCount = 0;                        // Retries already performed for this call
    long status = 0;                                // HTTP status, 0 when no response arrived
    int transportCode = 0;                          // CURLcode of the failed transfer, 0 if unknown or none
    bool transportFailed = false;                   // True when the attempt ended without a response
    Headers headers;                                // Response headers, empty on transport failure
};

/**
 * Type alias for retry condition function.
 * Returns true if the attempt should be retried.
 */
using RetryConditionFn = std::function<bool(const AttemptRecord&)>;

/**
 * Type alias for backoff scheduling function.
 * Returns the delay in seconds before the next attempt, 0 meaning retry at once.
 */
using BackoffScheduleFn = std::function<double(const AttemptRecord&)>;

/**
 * Configuration for RetryInterceptor.
 * The attempt limit itself belongs to HttpClientOptions::maxRetryCount.
 */
struct RetryPolicy {
    RetryConditionFn shouldRetry;                   // Retry condition function
    BackoffScheduleFn getRetryDelay;                // Delay in seconds before the next attempt
    bool honorRetryAfter = true;                    // A numeric Retry-After header overrides getRetryDelay

    // Default constructor - transient transport errors and 429/5xx, exponential backoff
    // Defined in RetryStrategies.hpp after factory functions are available
    RetryPolicy();
};

} // namespace http_pipeline
