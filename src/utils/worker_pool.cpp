#include "entity-pulse/utils/worker_pool.hpp"
#include "entity-pulse/utils/logging.hpp"

#include <algorithm>

namespace entitypulse::utils {

namespace {
thread_local const WorkerPool *current_pool = nullptr;
} // namespace

WorkerPool::WorkerPool(std::size_t threads) {
	if (threads == 0) {
		threads = std::max<std::size_t>(1, std::thread::hardware_concurrency());
	}
	workers_.reserve(threads);
	for (std::size_t i = 0; i < threads; ++i) {
		workers_.emplace_back([this]() { workerLoop(); });
	}
	ENTITYPULSE_DEBUG("WorkerPool started with {} threads.", threads);
}

WorkerPool::~WorkerPool() {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		stopping_ = true;
	}
	wake_.notify_all();
	for (auto &worker : workers_) {
		if (worker.joinable()) {
			worker.join();
		}
	}
}

bool WorkerPool::isWorkerThread() const {
	return current_pool == this;
}

CancellationToken WorkerPool::currentToken() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return generation_;
}

void WorkerPool::cancelAll() {
	std::lock_guard<std::mutex> lock(mutex_);
	generation_.cancel();
	generation_ = CancellationToken();
	ENTITYPULSE_INFO("WorkerPool: cancelled {} queued task(s) and all running tasks.", queue_.size());
}

void WorkerPool::enqueue(std::function<void()> job) {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (stopping_) {
			throw std::runtime_error("WorkerPool is shutting down.");
		}
		queue_.push_back(std::move(job));
	}
	wake_.notify_one();
}

void WorkerPool::workerLoop() {
	current_pool = this;
	for (;;) {
		std::function<void()> job;
		{
			std::unique_lock<std::mutex> lock(mutex_);
			wake_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
			if (queue_.empty()) {
				// stopping_ with nothing left to drain
				return;
			}
			job = std::move(queue_.front());
			queue_.pop_front();
		}
		// packaged_task stores any exception in its future.
		job();
	}
}

} // namespace entitypulse::utils
