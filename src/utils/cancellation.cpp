#include "entity-pulse/utils/cancellation.hpp"

namespace entitypulse::utils {

CancellationToken::CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {
}

CancellationToken CancellationToken::withBudget(std::chrono::milliseconds budget) {
	CancellationToken token;
	if (budget.count() > 0) {
		token.deadline_ = Clock::now() + budget;
	}
	return token;
}

CancellationToken CancellationToken::withDeadline(Clock::time_point deadline) const {
	CancellationToken child = *this;
	if (!child.deadline_ || deadline < *child.deadline_) {
		child.deadline_ = deadline;
	}
	return child;
}

void CancellationToken::cancel() const {
	flag_->store(true, std::memory_order_release);
}

bool CancellationToken::isCancelled() const {
	if (flag_->load(std::memory_order_acquire)) {
		return true;
	}
	return deadline_ && Clock::now() >= *deadline_;
}

void CancellationToken::throwIfCancelled(const char *where) const {
	if (!isCancelled()) {
		return;
	}
	const bool expired = !flag_->load(std::memory_order_acquire);
	std::string message = expired ? "Time budget exceeded" : "Task cancelled";
	if (where) {
		message += " in ";
		message += where;
	}
	throw TaskCancelled(message);
}

} // namespace entitypulse::utils
