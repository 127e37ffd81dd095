#include "concurrency_limiter.hpp"
#include "cancellation_token.hpp"
#include "harvest_logging.hpp"
#include "harvest_utils.hpp"

#include <algorithm>
#include <exception>

namespace harvester {

ConcurrencyLimiter::ConcurrencyLimiter(int max_concurrent, std::chrono::milliseconds dispatch_delay)
    : max_concurrent_(std::max(1, max_concurrent)),
      dispatch_delay_(std::max(dispatch_delay, std::chrono::milliseconds(0))) {
}

ConcurrencyLimiter::~ConcurrencyLimiter() {
	for (auto &worker : workers_) {
		if (worker.joinable()) {
			worker.join();
		}
	}
}

void ConcurrencyLimiter::Dispatch(size_t count, Task task, CrashHandler on_crash, const CancellationToken *cancel) {
	// A previous batch must be fully joined before the state is reused
	Wait();

	task_ = std::move(task);
	on_crash_ = std::move(on_crash);
	cancel_ = cancel;
	{
		std::lock_guard<std::mutex> lock(queue_mutex_);
		next_index_ = 0;
		count_ = count;
	}
	in_flight_.store(0);
	peak_in_flight_.store(0);
	dispatched_.store(0);
	completed_.store(0);
	crashed_.store(0);

	int num_workers = static_cast<int>(std::min<size_t>(count, static_cast<size_t>(max_concurrent_)));
	workers_.reserve(num_workers);
	for (int i = 0; i < num_workers; i++) {
		workers_.emplace_back(&ConcurrencyLimiter::WorkerLoop, this, i);
	}
	HARVEST_LOG_DEBUG("limiter started", {IntField("items", count), IntField("workers", num_workers),
	                                      IntField("dispatch_delay_ms", dispatch_delay_.count())});
}

LimiterStats ConcurrencyLimiter::Wait() {
	for (auto &worker : workers_) {
		if (worker.joinable()) {
			worker.join();
		}
	}
	workers_.clear();

	LimiterStats stats;
	stats.dispatched = dispatched_.load();
	stats.completed = completed_.load();
	stats.crashed = crashed_.load();
	stats.peak_in_flight = peak_in_flight_.load();
	{
		std::lock_guard<std::mutex> lock(queue_mutex_);
		stats.skipped = count_ - stats.dispatched;
	}
	return stats;
}

bool ConcurrencyLimiter::NextIndex(size_t &index) {
	std::lock_guard<std::mutex> lock(queue_mutex_);
	if (next_index_ >= count_) {
		return false;
	}
	if (cancel_ && cancel_->IsCancelled()) {
		return false;
	}
	index = next_index_++;
	return true;
}

void ConcurrencyLimiter::WorkerLoop(int worker_id) {
	size_t index = 0;
	while (NextIndex(index)) {
		// Pace the dispatch; a cancellation during the pause drops the item
		if (dispatch_delay_.count() > 0) {
			if (cancel_) {
				if (cancel_->WaitFor(dispatch_delay_)) {
					break;
				}
			} else {
				std::this_thread::sleep_for(dispatch_delay_);
			}
		}

		int now_in_flight = in_flight_.fetch_add(1) + 1;
		int peak = peak_in_flight_.load();
		while (now_in_flight > peak && !peak_in_flight_.compare_exchange_weak(peak, now_in_flight)) {
		}
		dispatched_.fetch_add(1);

		try {
			task_(index);
			completed_.fetch_add(1);
		} catch (const std::exception &ex) {
			crashed_.fetch_add(1);
			auto error = ExceptionMessage(ex);
			HARVEST_LOG_ERROR("task crashed", {IntField("worker", worker_id), IntField("index", index),
			                                   StringField("error", error)});
			if (on_crash_) {
				on_crash_(index, error);
			}
		} catch (...) {
			crashed_.fetch_add(1);
			HARVEST_LOG_ERROR("task crashed", {IntField("worker", worker_id), IntField("index", index),
			                                   StringField("error", "unknown exception")});
			if (on_crash_) {
				on_crash_(index, "unknown exception");
			}
		}

		in_flight_.fetch_sub(1);
	}
}

} // namespace harvester
