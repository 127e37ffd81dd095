#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace harvester {

class CancellationToken;

struct LimiterStats {
	size_t dispatched = 0;
	size_t completed = 0;
	size_t crashed = 0;       // tasks that threw
	size_t skipped = 0;       // never dispatched because of cancellation
	int peak_in_flight = 0;
};

// Bounded-concurrency dispatcher. Items 0..count-1 are dispatched in order
// onto at most max_concurrent worker threads; each dispatch waits
// dispatch_delay first. Completion order is unconstrained.
class ConcurrencyLimiter {
public:
	using Task = std::function<void(size_t index)>;
	// Called on the worker thread when a task throws; the worker keeps going
	using CrashHandler = std::function<void(size_t index, const std::string &error)>;

	ConcurrencyLimiter(int max_concurrent, std::chrono::milliseconds dispatch_delay);
	~ConcurrencyLimiter();

	ConcurrencyLimiter(const ConcurrencyLimiter &) = delete;
	ConcurrencyLimiter &operator=(const ConcurrencyLimiter &) = delete;

	// Starts the workers and returns immediately
	void Dispatch(size_t count, Task task, CrashHandler on_crash, const CancellationToken *cancel = nullptr);

	// Blocks until every dispatched task has returned
	LimiterStats Wait();

	int MaxConcurrent() const {
		return max_concurrent_;
	}
	int PeakInFlight() const {
		return peak_in_flight_.load();
	}

private:
	void WorkerLoop(int worker_id);
	bool NextIndex(size_t &index);

	int max_concurrent_;
	std::chrono::milliseconds dispatch_delay_;

	Task task_;
	CrashHandler on_crash_;
	const CancellationToken *cancel_ = nullptr;

	std::mutex queue_mutex_;
	size_t next_index_ = 0;
	size_t count_ = 0;

	std::atomic<int> in_flight_ {0};
	std::atomic<int> peak_in_flight_ {0};
	std::atomic<size_t> dispatched_ {0};
	std::atomic<size_t> completed_ {0};
	std::atomic<size_t> crashed_ {0};

	std::vector<std::thread> workers_;
};

} // namespace harvester
