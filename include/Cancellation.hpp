#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace http_pipeline {

class CancellationToken;

/**
 * Owner side of a cancellation signal. Copies share the same signal.
 * cancel() is idempotent and wakes every sleeping token.
 */
class CancellationSource {
public:
	CancellationSource();

	void cancel();
	bool isCancelled() const;
	CancellationToken token() const;

private:
	struct State {
		std::atomic<bool> cancelled{false};
		std::mutex mutex_;
		std::condition_variable cv_;
	};

	std::shared_ptr<State> state_;

	friend class CancellationToken;
};

/**
 * Observer side of a cancellation signal.
 * A default constructed token is never cancelled.
 */
class CancellationToken {
public:
	CancellationToken() = default;

	bool isCancelled() const;

	static constexpr double maxSleepSeconds = 24 * 60 * 60;

	// Sleep for `seconds`, at most maxSleepSeconds, unless cancelled first.
	// Returns false when woken by cancellation.
	bool sleepFor(double seconds) const;

private:
	explicit CancellationToken(std::shared_ptr<CancellationSource::State> state);

	std::shared_ptr<CancellationSource::State> state_;

	friend class CancellationSource;
};

} // namespace http_pipeline
