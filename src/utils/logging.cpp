#include "entity-pulse/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace entitypulse::utils {

namespace {
std::mutex &logger_mutex() {
	static std::mutex mutex;
	return mutex;
}
} // namespace

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	std::lock_guard<std::mutex> lock(logger_mutex());
	if (!logger_) {
		// Another component may already have registered the name.
		logger_ = spdlog::get("entity-pulse");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("entity-pulse");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		init();
	}
	return logger_;
}

} // namespace entitypulse::utils
