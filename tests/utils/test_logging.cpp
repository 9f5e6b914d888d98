#include <catch2/catch_test_macros.hpp>

#include "entity-pulse/utils/logging.hpp"

#include <spdlog/spdlog.h>

using entitypulse::utils::Logging;

TEST_CASE("Logging initializes singleton logger", "[utils][logging]") {
	auto &logger_ref = Logging::getLogger();
	REQUIRE(logger_ref);
	REQUIRE(logger_ref->name() == "entity-pulse");

	const auto first_level = logger_ref->level();

	Logging::init(spdlog::level::debug);
	auto &logger_after_init = Logging::getLogger();

	REQUIRE(logger_ref.get() == logger_after_init.get());
	REQUIRE(logger_after_init->level() == spdlog::level::debug);
	REQUIRE(logger_after_init->flush_level() == spdlog::level::debug);

	// Restore the previous level for downstream tests
	logger_after_init->set_level(first_level);
	logger_after_init->flush_on(first_level);
}

TEST_CASE("Logging macros write through the shared logger", "[utils][logging]") {
	const auto level = Logging::getLogger()->level();
	Logging::init(spdlog::level::off);
	ENTITYPULSE_INFO("suppressed message for {}", "acme");
	ENTITYPULSE_WARN("suppressed warning {}", 42);
	REQUIRE(Logging::getLogger()->level() == spdlog::level::off);
	Logging::init(level);
}
