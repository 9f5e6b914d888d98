#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/stats/descriptive.hpp"
#include "entity-pulse/stats/rolling.hpp"

#include <cmath>
#include <vector>

using namespace entitypulse::stats;

TEST_CASE("Trailing baseline excludes the current value", "[stats][rolling]") {
	const std::vector<double> values{2.0, 4.0, 6.0, 8.0, 100.0};
	const auto baseline = trailingBaseline(values, 3);

	REQUIRE(baseline.count == std::vector<std::size_t>{0, 1, 2, 3, 3});
	REQUIRE(baseline.mean[0] == Catch::Approx(2.0));
	REQUIRE(baseline.stdev[0] == Catch::Approx(0.0));
	REQUIRE(baseline.mean[1] == Catch::Approx(2.0));
	REQUIRE(baseline.stdev[1] == Catch::Approx(0.0));
	REQUIRE(baseline.mean[2] == Catch::Approx(3.0));
	REQUIRE(baseline.stdev[2] == Catch::Approx(std::sqrt(2.0)));
	// Window of index 4 is {4, 6, 8}; the spike itself does not enter it.
	REQUIRE(baseline.mean[4] == Catch::Approx(6.0));
	REQUIRE(baseline.stdev[4] == Catch::Approx(2.0));

	REQUIRE_THROWS_AS(trailingBaseline(values, 0), entitypulse::core::InvalidParameter);
}

TEST_CASE("Deviation scores are zero at the baseline mean", "[stats][rolling]") {
	const std::vector<double> values{5.0, 5.0, 5.0, 9.0};
	const auto baseline = trailingBaseline(values, 3);
	const auto scores = deviationScores(values, baseline);

	REQUIRE(scores[0] == 0.0);
	REQUIRE(scores[1] == 0.0);
	REQUIRE(scores[2] == 0.0);
	// A flat history gives a huge but finite score.
	REQUIRE(scores[3] > 1e9);
	REQUIRE(std::isfinite(scores[3]));
}

TEST_CASE("Descriptive helpers", "[stats][descriptive]") {
	const std::vector<double> values{1.0, 2.0, 3.0, 4.0};

	REQUIRE(mean(values) == Catch::Approx(2.5));
	REQUIRE(mean({}) == 0.0);
	REQUIRE(stddev(values) == Catch::Approx(std::sqrt(5.0 / 3.0)));
	REQUIRE(stddev(values, 0) == Catch::Approx(std::sqrt(1.25)));
	REQUIRE(stddev({7.0}) == 0.0);

	REQUIRE(quantile(values, 0.0) == Catch::Approx(1.0));
	REQUIRE(quantile(values, 0.25) == Catch::Approx(1.75));
	REQUIRE(quantile(values, 0.5) == Catch::Approx(2.5));
	REQUIRE(quantile(values, 1.0) == Catch::Approx(4.0));
	REQUIRE_THROWS_AS(quantile({}, 0.5), entitypulse::core::InvalidParameter);
	REQUIRE_THROWS_AS(quantile(values, 1.5), entitypulse::core::InvalidParameter);

	REQUIRE(averageRanks({10.0, 20.0, 10.0, 30.0}) == std::vector<double>{1.5, 3.0, 1.5, 4.0});
	REQUIRE(matrixVariance({{1.0, 3.0}, {1.0, 3.0}}) == Catch::Approx(1.0));
}
