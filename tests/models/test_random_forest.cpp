#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "entity-pulse/models/random_forest.hpp"
#include "entity-pulse/models/regression_tree.hpp"
#include "entity-pulse/utils/cancellation.hpp"

#include <stdexcept>

using entitypulse::models::RandomForestBuilder;
using entitypulse::models::RegressionTree;

namespace {

// y = 1 for x < 5, else 3.
void stepData(Eigen::MatrixXd &x, Eigen::VectorXd &y) {
	x.resize(10, 1);
	y.resize(10);
	for (Eigen::Index i = 0; i < 10; ++i) {
		x(i, 0) = static_cast<double>(i);
		y[i] = i < 5 ? 1.0 : 3.0;
	}
}

Eigen::MatrixXd column(std::initializer_list<double> values) {
	Eigen::MatrixXd m(static_cast<Eigen::Index>(values.size()), 1);
	Eigen::Index i = 0;
	for (double v : values) {
		m(i++, 0) = v;
	}
	return m;
}

} // namespace

TEST_CASE("Regression tree splits at the midpoint", "[models][random_forest][tree]") {
	Eigen::MatrixXd x;
	Eigen::VectorXd y;
	stepData(x, y);

	RegressionTree tree;
	tree.fit(x, y);
	REQUIRE(tree.nodeCount() == 3);
	REQUIRE(tree.depth() == 1);

	const auto predicted = tree.predict(column({0.0, 4.4, 4.6, 9.0}));
	REQUIRE(predicted[0] == 1.0);
	REQUIRE(predicted[1] == 1.0);
	REQUIRE(predicted[2] == 3.0);
	REQUIRE(predicted[3] == 3.0);
}

TEST_CASE("Regression tree depth and leaf limits", "[models][random_forest][tree]") {
	Eigen::MatrixXd x = column({0, 1, 2, 3, 4, 5, 6, 7});
	Eigen::VectorXd y(8);
	y << 0, 1, 2, 3, 4, 5, 6, 7;

	RegressionTree stump(RegressionTree::Options{1, 2, 1});
	stump.fit(x, y);
	REQUIRE(stump.depth() == 1);
	REQUIRE(stump.predictRow(x.row(0)) == Catch::Approx(1.5));
	REQUIRE(stump.predictRow(x.row(7)) == Catch::Approx(5.5));

	RegressionTree full;
	full.fit(x, y);
	REQUIRE(full.predict(x).isApprox(y));

	REQUIRE_THROWS_AS(RegressionTree(RegressionTree::Options{0, 2, 1}), std::invalid_argument);
	REQUIRE_THROWS_AS(RegressionTree(RegressionTree::Options{3, 1, 1}), std::invalid_argument);
	REQUIRE_THROWS_AS(RegressionTree().predict(x), std::runtime_error);
	REQUIRE_THROWS_AS(full.predict(Eigen::MatrixXd::Zero(1, 2)), std::invalid_argument);
}

TEST_CASE("Random forest averages its trees", "[models][random_forest]") {
	Eigen::MatrixXd x;
	Eigen::VectorXd y;
	stepData(x, y);

	SECTION("without bootstrap every tree is the same") {
		auto forest = RandomForestBuilder().withEstimators(5).withBootstrap(false).build();
		forest->fit(x, y);
		REQUIRE(forest->treeCount() == 5);
		REQUIRE(forest->predict(x).isApprox(y));
	}

	SECTION("bootstrap forests are reproducible for a seed") {
		auto first = RandomForestBuilder().withEstimators(50).withSeed(7).build();
		auto second = RandomForestBuilder().withEstimators(50).withSeed(7).build();
		first->fit(x, y);
		second->fit(x, y);

		const auto query = column({0.0, 9.0});
		const auto a = first->predict(query);
		REQUIRE(a == second->predict(query));
		REQUIRE(a[0] < 1.5);
		REQUIRE(a[1] > 2.5);
		for (Eigen::Index i = 0; i < a.size(); ++i) {
			REQUIRE(a[i] >= 1.0);
			REQUIRE(a[i] <= 3.0);
		}
	}
}

TEST_CASE("Random forest misuse is reported", "[models][random_forest]") {
	REQUIRE_THROWS_AS(RandomForestBuilder().withEstimators(0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(RandomForestBuilder().withMaxDepth(0).build(), std::invalid_argument);

	auto forest = RandomForestBuilder().build();
	REQUIRE(forest->getName() == "RandomForest");
	REQUIRE_THROWS_AS(forest->predict(column({1.0})), std::runtime_error);
	REQUIRE_THROWS_AS(forest->fit(Eigen::MatrixXd(0, 1), Eigen::VectorXd(0)), std::invalid_argument);

	Eigen::MatrixXd x;
	Eigen::VectorXd y;
	stepData(x, y);
	const entitypulse::utils::CancellationToken token;
	token.cancel();
	REQUIRE_THROWS_AS(forest->fit(x, y, token), entitypulse::utils::TaskCancelled);
}
