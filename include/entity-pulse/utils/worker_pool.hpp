#pragma once

#include "entity-pulse/utils/cancellation.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace entitypulse::utils {

/**
 * @class WorkerPool
 * @brief A fixed-size pool of threads executing independent analysis tasks.
 *
 * Each task is a callable taking a `const CancellationToken &`. The token is tripped by
 * cancelAll() and, when a budget is given, expires that long after the task starts running.
 * Tasks poll it at their natural checkpoints; the pool never interrupts a thread.
 *
 * Tasks submitted from one of the pool's own workers run inline on that worker, so a task may
 * fan out without exhausting the pool.
 */
class WorkerPool {
public:
	/**
	 * @param threads Number of workers; 0 selects std::thread::hardware_concurrency().
	 */
	explicit WorkerPool(std::size_t threads = 0);
	~WorkerPool();

	WorkerPool(const WorkerPool &) = delete;
	WorkerPool &operator=(const WorkerPool &) = delete;

	template <typename F>
	auto submit(F &&task, std::chrono::milliseconds budget = std::chrono::milliseconds::zero())
	    -> std::future<std::invoke_result_t<std::decay_t<F>, const CancellationToken &>>;

	/// Cancels every task submitted so far; later submissions get a fresh token.
	void cancelAll();

	std::size_t size() const {
		return workers_.size();
	}

	/// True when called from one of this pool's worker threads.
	bool isWorkerThread() const;

private:
	void enqueue(std::function<void()> job);
	void workerLoop();
	CancellationToken currentToken() const;

	std::vector<std::thread> workers_;
	std::deque<std::function<void()>> queue_;
	mutable std::mutex mutex_;
	std::condition_variable wake_;
	bool stopping_ = false;
	CancellationToken generation_;
};

template <typename F>
auto WorkerPool::submit(F &&task, std::chrono::milliseconds budget)
    -> std::future<std::invoke_result_t<std::decay_t<F>, const CancellationToken &>> {
	using R = std::invoke_result_t<std::decay_t<F>, const CancellationToken &>;

	const CancellationToken parent = currentToken();
	auto packaged = std::make_shared<std::packaged_task<R()>>(
	    [fn = std::forward<F>(task), parent, budget]() mutable -> R {
		    // The budget starts when the task is picked up, not when it was queued.
		    const CancellationToken token =
		        budget.count() > 0 ? parent.withDeadline(CancellationToken::Clock::now() + budget) : parent;
		    return fn(token);
	    });
	auto future = packaged->get_future();

	if (isWorkerThread()) {
		(*packaged)();
		return future;
	}
	enqueue([packaged]() { (*packaged)(); });
	return future;
}

/**
 * @brief Runs @p task on @p pool when one is given, otherwise immediately on the caller's thread.
 *
 * Either way the result (or the task's exception) is delivered through the returned future.
 */
template <typename F>
auto dispatch(const std::shared_ptr<WorkerPool> &pool, F &&task,
              std::chrono::milliseconds budget = std::chrono::milliseconds::zero())
    -> std::future<std::invoke_result_t<std::decay_t<F>, const CancellationToken &>> {
	using R = std::invoke_result_t<std::decay_t<F>, const CancellationToken &>;
	if (pool) {
		return pool->submit(std::forward<F>(task), budget);
	}
	std::packaged_task<R()> packaged([fn = std::forward<F>(task), budget]() mutable -> R {
		const CancellationToken token = CancellationToken::withBudget(budget);
		return fn(token);
	});
	auto future = packaged.get_future();
	packaged();
	return future;
}

/**
 * @brief Blocks until every future of a fan-out is ready.
 *
 * Call before the first get() when the tasks reference caller-owned data: get() rethrows a task's
 * exception, and the caller must not unwind while later tasks still read that data.
 */
template <typename T>
void waitAll(const std::vector<std::future<T>> &futures) {
	for (const auto &future : futures) {
		future.wait();
	}
}

/// waitAll() for futures tagged with the item they were submitted for.
template <typename Key, typename T>
void waitAll(const std::vector<std::pair<Key, std::future<T>>> &jobs) {
	for (const auto &job : jobs) {
		job.second.wait();
	}
}

} // namespace entitypulse::utils
