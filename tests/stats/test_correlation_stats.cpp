#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/stats/correlation.hpp"

#include <vector>

using namespace entitypulse::stats;

TEST_CASE("Pearson correlation with Student-t significance", "[stats][correlation]") {
	const auto result = pearson({1.0, 2.0, 3.0, 4.0, 5.0}, {2.0, 4.0, 5.0, 4.0, 5.0});

	REQUIRE(result.n == 5);
	REQUIRE(result.coefficient == Catch::Approx(0.7745967).epsilon(1e-6));
	REQUIRE(result.p_value == Catch::Approx(0.1240271).epsilon(1e-4));
}

TEST_CASE("Perfect correlation has zero p-value", "[stats][correlation]") {
	const std::vector<double> x{1.0, 2.0, 3.0, 4.0};

	const auto up = pearson(x, {2.0, 4.0, 6.0, 8.0});
	REQUIRE(up.coefficient == Catch::Approx(1.0));
	REQUIRE(up.p_value == 0.0);

	const auto down = pearson(x, {8.0, 6.0, 4.0, 2.0});
	REQUIRE(down.coefficient == Catch::Approx(-1.0));
	REQUIRE(down.p_value == 0.0);
}

TEST_CASE("Degenerate inputs give the neutral result", "[stats][correlation]") {
	SECTION("constant series") {
		const auto result = pearson({1.0, 2.0, 3.0}, {5.0, 5.0, 5.0});
		REQUIRE(result.coefficient == 0.0);
		REQUIRE(result.p_value == 1.0);
	}

	SECTION("fewer than three points") {
		const auto result = pearson({1.0, 2.0}, {2.0, 1.0});
		REQUIRE(result.coefficient == 0.0);
		REQUIRE(result.p_value == 1.0);
	}

	SECTION("length mismatch") {
		REQUIRE_THROWS_AS(pearson({1.0, 2.0, 3.0}, {1.0, 2.0}), entitypulse::core::InvalidParameter);
	}
}

TEST_CASE("Spearman correlation uses ranks", "[stats][correlation]") {
	// Monotone but not linear.
	const auto result = spearman({1.0, 2.0, 3.0, 4.0, 5.0}, {1.0, 4.0, 9.0, 16.0, 100.0});
	REQUIRE(result.coefficient == Catch::Approx(1.0));

	REQUIRE(correlate({1.0, 2.0, 3.0}, {3.0, 2.0, 1.0}, CorrelationMethod::Spearman).coefficient ==
	        Catch::Approx(-1.0));
}

TEST_CASE("Correlation method names round-trip", "[stats][correlation]") {
	REQUIRE(parseCorrelationMethod("pearson") == CorrelationMethod::Pearson);
	REQUIRE(toString(CorrelationMethod::Spearman) == "spearman");
	REQUIRE_THROWS_AS(parseCorrelationMethod("kendall"), entitypulse::core::InvalidParameter);
}
