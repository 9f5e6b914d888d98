#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace entitypulse::utils {

/**
 * @class TaskCancelled
 * @brief Thrown from a cancellation point once the task was cancelled or ran out of time.
 */
class TaskCancelled : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * @class CancellationToken
 * @brief Cooperative cancellation signal with an optional deadline.
 *
 * Copies share the same flag. A default-constructed token is never cancelled, so code paths
 * that run outside a worker pool can poll it unconditionally.
 */
class CancellationToken {
public:
	using Clock = std::chrono::steady_clock;

	CancellationToken();

	/// Token that expires @p budget from now; a zero budget means no deadline.
	static CancellationToken withBudget(std::chrono::milliseconds budget);

	/// Child sharing this token's flag but with its own (earlier) deadline.
	CancellationToken withDeadline(Clock::time_point deadline) const;

	void cancel() const;
	bool isCancelled() const;
	void throwIfCancelled(const char *where = nullptr) const;

	std::optional<Clock::time_point> deadline() const {
		return deadline_;
	}

private:
	std::shared_ptr<std::atomic<bool>> flag_;
	std::optional<Clock::time_point> deadline_;
};

} // namespace entitypulse::utils
