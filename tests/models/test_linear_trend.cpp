#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "entity-pulse/models/linear_trend.hpp"
#include "common/time_series_helpers.hpp"

#include <stdexcept>

using entitypulse::models::LinearRegression;
using entitypulse::models::LinearTrend;
using tests::helpers::makeDailySeries;

TEST_CASE("Linear trend extrapolates a straight line", "[models][linear_trend]") {
	LinearTrend model;
	model.fit(makeDailySeries({3, 5, 7, 9, 11}));

	REQUIRE(model.slope() == Catch::Approx(2.0));
	REQUIRE(model.intercept() == Catch::Approx(3.0));
	const auto forecast = model.predict(3);
	REQUIRE(forecast.size() == 3);
	REQUIRE(forecast[0] == Catch::Approx(13.0));
	REQUIRE(forecast[2] == Catch::Approx(17.0));
}

TEST_CASE("Linear trend fits noisy data by least squares", "[models][linear_trend]") {
	LinearTrend model;
	model.fit(makeDailySeries({1, 3, 2, 4}));
	// x = 0..3: slope = 0.8, intercept = 1.3
	REQUIRE(model.slope() == Catch::Approx(0.8));
	REQUIRE(model.intercept() == Catch::Approx(1.3));
	REQUIRE(model.predict(1)[0] == Catch::Approx(4.5));
}

TEST_CASE("Linear regression handles several features", "[models][linear_trend]") {
	Eigen::MatrixXd x(5, 2);
	x << 0, 1, 1, 0, 2, 2, 3, 1, 4, 5;
	Eigen::VectorXd y(5);
	for (Eigen::Index i = 0; i < 5; ++i) {
		y[i] = 1.0 + 2.0 * x(i, 0) - 0.5 * x(i, 1);
	}
	LinearRegression regression;
	regression.fit(x, y);
	REQUIRE(regression.intercept() == Catch::Approx(1.0));
	REQUIRE(regression.coefficients()[0] == Catch::Approx(2.0));
	REQUIRE(regression.coefficients()[1] == Catch::Approx(-0.5));

	Eigen::MatrixXd query(1, 2);
	query << 10, 4;
	REQUIRE(regression.predict(query)[0] == Catch::Approx(19.0));
	REQUIRE_THROWS_AS(regression.predict(Eigen::MatrixXd::Zero(1, 3)), std::invalid_argument);
}

TEST_CASE("Linear trend misuse is reported", "[models][linear_trend]") {
	LinearTrend model;
	REQUIRE(model.slope() == 0.0);
	REQUIRE_THROWS_AS(model.predict(2), std::runtime_error);
	REQUIRE_THROWS_AS(model.fit(makeDailySeries({4})), std::invalid_argument);
	REQUIRE_THROWS_AS(LinearRegression().predict(Eigen::MatrixXd::Zero(1, 1)), std::runtime_error);
	REQUIRE_THROWS_AS(LinearRegression().fit(Eigen::MatrixXd::Zero(2, 1), Eigen::VectorXd::Zero(3)),
	                  std::invalid_argument);
}
