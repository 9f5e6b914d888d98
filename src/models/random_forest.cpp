#include "entity-pulse/models/random_forest.hpp"
#include "entity-pulse/utils/logging.hpp"

#include <numeric>
#include <random>
#include <stdexcept>

namespace entitypulse::models {

RandomForestRegressor::RandomForestRegressor(std::size_t n_estimators, RegressionTree::Options tree_options,
                                             bool bootstrap, unsigned seed)
    : n_estimators_(n_estimators), tree_options_(tree_options), bootstrap_(bootstrap), seed_(seed) {
	if (n_estimators_ == 0) {
		throw std::invalid_argument("RandomForest needs at least one tree.");
	}
	// Validates the tree options eagerly.
	const RegressionTree validated(tree_options_);
	(void)validated;
}

void RandomForestRegressor::fit(const Eigen::MatrixXd &x, const Eigen::VectorXd &y,
                                const utils::CancellationToken &token) {
	if (x.rows() == 0 || x.rows() != y.size()) {
		throw std::invalid_argument("RandomForest needs a non-empty design matrix matching the target.");
	}
	trees_.clear();
	trees_.reserve(n_estimators_);

	std::mt19937 rng(seed_);
	std::uniform_int_distribution<Eigen::Index> pick(0, x.rows() - 1);
	std::vector<Eigen::Index> rows(static_cast<std::size_t>(x.rows()));
	for (std::size_t t = 0; t < n_estimators_; ++t) {
		token.throwIfCancelled("RandomForestRegressor::fit");
		if (bootstrap_) {
			for (auto &row : rows) {
				row = pick(rng);
			}
		} else {
			std::iota(rows.begin(), rows.end(), 0);
		}
		RegressionTree tree(tree_options_);
		tree.fit(x, y, rows);
		trees_.push_back(std::move(tree));
	}
	ENTITYPULSE_DEBUG("RandomForest fitted {} trees on {} rows.", trees_.size(), x.rows());
}

Eigen::VectorXd RandomForestRegressor::predict(const Eigen::MatrixXd &x) const {
	if (trees_.empty()) {
		throw std::runtime_error("RandomForest::predict called before fit.");
	}
	Eigen::VectorXd sum = Eigen::VectorXd::Zero(x.rows());
	for (const auto &tree : trees_) {
		sum += tree.predict(x);
	}
	return sum / static_cast<double>(trees_.size());
}

RandomForestBuilder &RandomForestBuilder::withEstimators(std::size_t n_estimators) {
	n_estimators_ = n_estimators;
	return *this;
}

RandomForestBuilder &RandomForestBuilder::withMaxDepth(std::size_t max_depth) {
	tree_options_.max_depth = max_depth;
	return *this;
}

RandomForestBuilder &RandomForestBuilder::withMinSamplesLeaf(std::size_t min_samples_leaf) {
	tree_options_.min_samples_leaf = min_samples_leaf;
	return *this;
}

RandomForestBuilder &RandomForestBuilder::withBootstrap(bool bootstrap) {
	bootstrap_ = bootstrap;
	return *this;
}

RandomForestBuilder &RandomForestBuilder::withSeed(unsigned seed) {
	seed_ = seed;
	return *this;
}

std::unique_ptr<RandomForestRegressor> RandomForestBuilder::build() {
	return std::unique_ptr<RandomForestRegressor>(
	    new RandomForestRegressor(n_estimators_, tree_options_, bootstrap_, seed_));
}

} // namespace entitypulse::models
