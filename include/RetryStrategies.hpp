#pragma once

#include "RetryPolicy.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cmath>
#include <set>
#include <tuple>
#include <type_traits>
#include <utility>

namespace http_pipeline {
namespace retry {

// ============ Retry Conditions ============

/**
 * Retry on transient CURL errors.
 * Failures that carry no CURLcode are not considered transient.
 */
inline RetryConditionFn transportErrorCondition() {
    return [](const AttemptRecord& record) -> bool {
        if (!record.transportFailed) return false;

        switch (static_cast<CURLcode>(record.transportCode)) {
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_CONNECT:
            case CURLE_OPERATION_TIMEDOUT:
            case CURLE_SSL_CONNECT_ERROR:
            case CURLE_SEND_ERROR:
            case CURLE_RECV_ERROR:
            case CURLE_GOT_NOTHING:
                return true;
            default:
                return false;
        }
    };
}

/**
 * Retry on specific HTTP status codes.
 * Default: 429 (Too Many Requests), 500, 502, 503, 504 (Server Errors)
 */
inline RetryConditionFn httpStatusCondition(std::set<long> codes = {429, 500, 502, 503, 504}) {
    return [codes = std::move(codes)](const AttemptRecord& record) -> bool {
        if (record.transportFailed) return false;
        return codes.count(record.status) > 0;
    };
}

// SFINAE predictor for RetryConditionFn
template <class Fn>
using is_retry_pred = std::is_invocable_r<bool, Fn&, const AttemptRecord&>;

/**
 * Combine multiple conditions with OR logic.
 * Returns true if any condition returns true.
 */
template <class... Fns,
          std::enable_if_t<
              (sizeof...(Fns) > 0) &&
              (is_retry_pred<std::decay_t<Fns>>::value && ...) &&
              (std::is_copy_constructible_v<std::decay_t<Fns>> && ...),
              int> = 0>
inline RetryConditionFn anyOf(Fns&&... fns) {
    return [fs = std::tuple<std::decay_t<Fns>...>(std::forward<Fns>(fns)...)]
           (const AttemptRecord& record) -> bool {
        return std::apply(
            [&](auto&... g) { return ((static_cast<bool>(g(record))) || ...); },
            fs
        );
    };
}

/**
 * Combine multiple conditions with AND logic.
 */
template <class... Fns,
          std::enable_if_t<
              (sizeof...(Fns) > 0) &&
              (is_retry_pred<std::decay_t<Fns>>::value && ...) &&
              (std::is_copy_constructible_v<std::decay_t<Fns>> && ...),
              int> = 0>
inline RetryConditionFn allOf(Fns&&... fns) {
    return [fs = std::tuple<std::decay_t<Fns>...>(std::forward<Fns>(fns)...)]
           (const AttemptRecord& record) -> bool {
        return std::apply(
            [&](auto&... g) { return ((static_cast<bool>(g(record))) && ...); },
            fs
        );
    };
}

/**
 * Default retry condition: transient transport errors, 429 and 5xx gateway statuses.
 */
inline RetryConditionFn defaultCondition() {
    return anyOf(transportErrorCondition(), httpStatusCondition());
}

// ============ Backoff Strategies ============
// All return a relative delay in seconds

/**
 * Exponential backoff with optional jitter.
 * delay = min(baseDelay * multiplier^retryCount, maxDelay) + jitter
 */
inline BackoffScheduleFn exponentialBackoff(
    double baseDelay = 0.1,      // 100ms in seconds
    double maxDelay = 30.0,      // 30 seconds
    double multiplier = 2.0,
    double jitterFactor = 0.3)
{
    return [=](const AttemptRecord& record) -> double {
        double delay = baseDelay * std::pow(multiplier, static_cast<double>(record.retryCount));
        delay = std::min(delay, maxDelay);

        if (jitterFactor > 0) {
            double jitter = util::jitter_generator(static_cast<float>(delay * jitterFactor));
            delay += jitter;
            delay = std::max(0.0, delay);
        }

        return delay;
    };
}

/**
 * Fixed delay between retries.
 */
inline BackoffScheduleFn fixedDelay(double delay = 1.0) {  // 1 second default
    return [delay](const AttemptRecord&) -> double {
        return delay;
    };
}

/**
 * Linear backoff: delay increases linearly with each retry.
 * delay = min(initialDelay + increment * retryCount, maxDelay)
 */
inline BackoffScheduleFn linearBackoff(
    double initialDelay = 0.1,   // 100ms in seconds
    double increment = 0.1,      // 100ms increment
    double maxDelay = 5.0)       // 5 seconds max
{
    return [=](const AttemptRecord& record) -> double {
        double delay = initialDelay + increment * static_cast<double>(record.retryCount);
        return std::min(delay, maxDelay);
    };
}

/**
 * Immediate retry - no delay.
 */
inline BackoffScheduleFn immediate() {
    return [](const AttemptRecord&) -> double {
        return 0;
    };
}

} // namespace retry

// Default constructor implementation for RetryPolicy
inline RetryPolicy::RetryPolicy()
    : shouldRetry(retry::defaultCondition())
    , getRetryDelay(retry::exponentialBackoff())
    , honorRetryAfter(true)
{}

} // namespace http_pipeline
