#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace harvester {

// Caller-owned run cancellation flag. Sleeps taken through WaitFor() wake
// immediately once Cancel() is called.
class CancellationToken {
public:
	CancellationToken() = default;

	CancellationToken(const CancellationToken &) = delete;
	CancellationToken &operator=(const CancellationToken &) = delete;

	void Cancel() {
		{
			std::lock_guard<std::mutex> lock(mutex_);
			cancelled_.store(true);
		}
		cv_.notify_all();
	}

	bool IsCancelled() const {
		return cancelled_.load();
	}

	// Returns true if cancelled before the duration elapsed
	bool WaitFor(std::chrono::milliseconds duration) const {
		if (duration.count() <= 0) {
			return IsCancelled();
		}
		std::unique_lock<std::mutex> lock(mutex_);
		return cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
	}

private:
	std::atomic<bool> cancelled_{false};
	mutable std::mutex mutex_;
	mutable std::condition_variable cv_;
};

} // namespace harvester
