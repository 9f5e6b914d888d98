#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "entity-pulse/models/holt_winters.hpp"
#include "common/time_series_helpers.hpp"

#include <cmath>
#include <stdexcept>

using entitypulse::models::HoltWintersBuilder;
using tests::helpers::makeDailySeries;
using tests::helpers::makeWeekly;

TEST_CASE("Holt-Winters with fixed parameters tracks a weekly pattern", "[models][holt_winters]") {
	const auto values = makeWeekly(56, 10.0, 0.5);
	auto model = HoltWintersBuilder().withSeasonalPeriod(7).withParameters(0.3, 0.1, 0.1).build();
	model->fit(makeDailySeries(values));

	REQUIRE(model->parameters().alpha == Catch::Approx(0.3));
	REQUIRE(model->fittedValues().size() == values.size());
	REQUIRE(model->sse() == Catch::Approx(52.1063).epsilon(1e-4));

	const auto forecast = model->predict(14);
	REQUIRE(forecast.size() == 14);
	const auto truth = makeWeekly(70, 10.0, 0.5);
	for (std::size_t h = 0; h < forecast.size(); ++h) {
		REQUIRE(std::abs(forecast[h] - truth[56 + h]) < 2.0);
	}
}

TEST_CASE("Optimised Holt-Winters does not do worse than its starting point", "[models][holt_winters]") {
	const auto values = makeWeekly(56, 10.0, 0.5);
	auto fixed = HoltWintersBuilder().withParameters(0.3, 0.1, 0.1).build();
	fixed->fit(makeDailySeries(values));
	auto fitted = HoltWintersBuilder().build();
	fitted->fit(makeDailySeries(values));

	REQUIRE(fitted->sse() <= fixed->sse() + 1e-9);
	const auto &params = fitted->parameters();
	for (double p : {params.alpha, params.beta, params.gamma}) {
		REQUIRE(p > 0.0);
		REQUIRE(p < 1.0);
	}
}

TEST_CASE("Holt-Winters validation", "[models][holt_winters]") {
	REQUIRE_THROWS_AS(HoltWintersBuilder().withSeasonalPeriod(1).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(HoltWintersBuilder().withParameters(1.5, 0.1, 0.1).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(HoltWintersBuilder().withMaxIterations(0).build(), std::invalid_argument);

	auto model = HoltWintersBuilder().build();
	REQUIRE_THROWS_AS(model->predict(3), std::runtime_error);
	REQUIRE_THROWS_AS(model->fit(makeDailySeries(makeWeekly(13))), std::invalid_argument);
	REQUIRE_NOTHROW(model->fit(makeDailySeries(makeWeekly(14))));
	REQUIRE(model->predict(-1).empty());
	REQUIRE(model->getName() == "HoltWinters");
}
