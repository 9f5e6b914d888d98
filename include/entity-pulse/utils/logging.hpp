#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace entitypulse::utils {

/**
 * @class Logging
 * @brief Process-wide access point to the library's spdlog logger.
 *
 * All components write through the same logger, named "entity-pulse". Embedding
 * applications adjust verbosity once at startup with init().
 */
class Logging {
public:
	/**
	 * @brief Gets the shared logger, creating it at info level on first use.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Creates the logger if needed and sets its level and flush level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace entitypulse::utils

#define ENTITYPULSE_TRACE(...)    entitypulse::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define ENTITYPULSE_DEBUG(...)    entitypulse::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define ENTITYPULSE_INFO(...)     entitypulse::utils::Logging::getLogger()->info(__VA_ARGS__)
#define ENTITYPULSE_WARN(...)     entitypulse::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define ENTITYPULSE_ERROR(...)    entitypulse::utils::Logging::getLogger()->error(__VA_ARGS__)
#define ENTITYPULSE_CRITICAL(...) entitypulse::utils::Logging::getLogger()->critical(__VA_ARGS__)
