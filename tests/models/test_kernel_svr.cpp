#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "entity-pulse/models/kernel_svr.hpp"

#include <cmath>
#include <stdexcept>

using entitypulse::models::KernelSVRBuilder;

namespace {

Eigen::MatrixXd grid(Eigen::Index n, double step, double offset = 0.0) {
	Eigen::MatrixXd x(n, 1);
	for (Eigen::Index i = 0; i < n; ++i) {
		x(i, 0) = offset + step * static_cast<double>(i);
	}
	return x;
}

} // namespace

TEST_CASE("Kernel SVR fits a smooth curve within the tube", "[models][kernel_svr]") {
	const Eigen::MatrixXd x = grid(25, 0.25);
	const Eigen::VectorXd y = x.col(0).array().sin().matrix();

	auto model = KernelSVRBuilder().withC(10.0).withEpsilon(0.05).withGamma(1.0).build();
	model->fit(x, y);

	REQUIRE(model->gamma() == 1.0);
	REQUIRE(model->sweeps() >= 1);
	REQUIRE(model->supportVectorCount() > 0);
	REQUIRE(model->supportVectorCount() <= 25);
	REQUIRE(model->dualCoefficients().cwiseAbs().maxCoeff() <= 10.0);

	const Eigen::VectorXd fitted = model->predict(x);
	REQUIRE((fitted - y).cwiseAbs().maxCoeff() < 0.1);

	// Between the training points.
	const Eigen::MatrixXd between = grid(24, 0.25, 0.125);
	const Eigen::VectorXd expected = between.col(0).array().sin().matrix();
	REQUIRE((model->predict(between) - expected).cwiseAbs().maxCoeff() < 0.1);
}

TEST_CASE("Far from the data only the bias remains", "[models][kernel_svr]") {
	const Eigen::MatrixXd x = grid(25, 0.25);
	const Eigen::VectorXd y = x.col(0).array().sin().matrix();
	auto model = KernelSVRBuilder().withC(10.0).withEpsilon(0.05).withGamma(1.0).build();
	model->fit(x, y);

	Eigen::MatrixXd far(1, 1);
	far << 1000.0;
	REQUIRE(model->predict(far)[0] == Catch::Approx(model->dualCoefficients().sum()));
}

TEST_CASE("Kernel SVR picks gamma from the feature variance", "[models][kernel_svr]") {
	// Values 0..4 have variance 2.
	const Eigen::MatrixXd x = grid(5, 1.0);
	Eigen::VectorXd y(5);
	y << 1, 2, 3, 2, 1;
	auto model = KernelSVRBuilder().build();
	model->fit(x, y);
	REQUIRE(model->gamma() == Catch::Approx(0.5));
}

TEST_CASE("Kernel SVR validation", "[models][kernel_svr]") {
	REQUIRE_THROWS_AS(KernelSVRBuilder().withC(0.0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(KernelSVRBuilder().withEpsilon(-0.1).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(KernelSVRBuilder().withGamma(0.0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(KernelSVRBuilder().withMaxSweeps(0).build(), std::invalid_argument);

	auto model = KernelSVRBuilder().build();
	REQUIRE(model->getName() == "KernelSVR");
	REQUIRE_THROWS_AS(model->predict(grid(2, 1.0)), std::runtime_error);
	REQUIRE_THROWS_AS(model->fit(grid(3, 1.0), Eigen::VectorXd::Zero(2)), std::invalid_argument);

	model->fit(grid(3, 1.0), Eigen::VectorXd::Ones(3));
	REQUIRE_THROWS_AS(model->predict(Eigen::MatrixXd::Zero(1, 2)), std::invalid_argument);
}
