#include "Cancellation.hpp"

#include <thread>
#include <utility>

namespace http_pipeline {

CancellationSource::CancellationSource() : state_(std::make_shared<State>()) {}

void CancellationSource::cancel() {
	{
		std::lock_guard<std::mutex> lk(this->state_->mutex_);
		this->state_->cancelled.store(true, std::memory_order_release);
	}
	this->state_->cv_.notify_all();
}

bool CancellationSource::isCancelled() const {
	return this->state_->cancelled.load(std::memory_order_acquire);
}

CancellationToken CancellationSource::token() const {
	return CancellationToken(this->state_);
}

CancellationToken::CancellationToken(std::shared_ptr<CancellationSource::State> state) : state_(std::move(state)) {}

bool CancellationToken::isCancelled() const {
	return this->state_ && this->state_->cancelled.load(std::memory_order_acquire);
}

bool CancellationToken::sleepFor(double seconds) const {
	// NaN and negative sleep nothing, longer delays are cut to maxSleepSeconds
	if (!(seconds > 0))
		seconds = 0;
	else if (seconds > CancellationToken::maxSleepSeconds)
		seconds = CancellationToken::maxSleepSeconds;

	auto duration = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::duration<double>(seconds));
	auto deadline = std::chrono::steady_clock::now() + duration;

	if (!this->state_) {
		std::this_thread::sleep_until(deadline);
		return true;
	}

	std::unique_lock<std::mutex> lk(this->state_->mutex_);
	bool cancelled = this->state_->cv_.wait_until(lk, deadline, [this]() {
		return this->state_->cancelled.load(std::memory_order_acquire);
	});
	return !cancelled;
}

} // namespace http_pipeline
