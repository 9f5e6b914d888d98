#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "entity-pulse/models/linear_trend.hpp"
#include "entity-pulse/models/random_forest.hpp"
#include "entity-pulse/utils/cross_validation.hpp"

#include <memory>
#include <stdexcept>

using namespace entitypulse::utils;
using entitypulse::models::IRegressor;
using entitypulse::models::LinearRegression;

namespace {

std::unique_ptr<IRegressor> linear() {
	return std::make_unique<LinearRegression>();
}

} // namespace

TEST_CASE("CrossValidation generateFolds expanding window", "[utils][cross_validation]") {
	const auto folds = CrossValidation::generateFolds(10, 3);
	REQUIRE(folds.size() == 3);
	for (int i = 0; i < 3; ++i) {
		const auto &fold = folds[static_cast<std::size_t>(i)];
		REQUIRE(fold.fold_id == i);
		REQUIRE(fold.test_start == 4 + 2 * i);
		REQUIRE(fold.test_end == fold.test_start + 2);
		REQUIRE(fold.train_end == fold.test_start);
	}

	// Leftover rows go to the first training window.
	const auto uneven = CrossValidation::generateFolds(53, 5);
	REQUIRE(uneven.front().test_start == 13);
	REQUIRE(uneven.back().test_end == 53);
}

TEST_CASE("CrossValidation rejects impossible splits", "[utils][cross_validation]") {
	REQUIRE_THROWS_AS(CrossValidation::generateFolds(10, 1), std::invalid_argument);
	REQUIRE_THROWS_AS(CrossValidation::generateFolds(3, 3), std::invalid_argument);
	REQUIRE_NOTHROW(CrossValidation::generateFolds(4, 3));
}

TEST_CASE("CrossValidation scores one-step predictions per fold", "[utils][cross_validation]") {
	Eigen::MatrixXd x(20, 1);
	Eigen::VectorXd y(20);
	for (int i = 0; i < 20; ++i) {
		x(i, 0) = i;
		y[i] = 2.0 * i + 1.0;
	}

	const auto results = CrossValidation::evaluate(x, y, linear, 4);
	REQUIRE(results.folds.size() == 4);
	for (const auto &fold : results.folds) {
		REQUIRE(fold.predictions.size() == 4);
		REQUIRE(fold.actuals.size() == 4);
		REQUIRE(fold.actuals.front() == Catch::Approx(2.0 * fold.test_start + 1.0));
		REQUIRE(fold.metrics.mae == Catch::Approx(0.0).margin(1e-8));
	}
	REQUIRE(results.average.n == 16);
	REQUIRE(results.average.mae == Catch::Approx(0.0).margin(1e-8));
	REQUIRE(*results.average.r_squared == Catch::Approx(1.0));
}

TEST_CASE("CrossValidation propagates misuse and cancellation", "[utils][cross_validation]") {
	Eigen::MatrixXd x(12, 1);
	x.setRandom();
	Eigen::VectorXd y(11);
	y.setZero();
	REQUIRE_THROWS_AS(CrossValidation::evaluate(x, y, linear, 3), std::invalid_argument);

	Eigen::VectorXd aligned(12);
	aligned.setZero();
	const CancellationToken token;
	token.cancel();
	REQUIRE_THROWS_AS(
	    CrossValidation::evaluate(
	        x, aligned, []() -> std::unique_ptr<IRegressor> { return entitypulse::models::RandomForestBuilder().build(); },
	        3, token),
	    TaskCancelled);
}
