#pragma once

#include "entity-pulse/models/regression_tree.hpp"

#include <memory>
#include <vector>

namespace entitypulse::models {

class RandomForestBuilder;

/**
 * @class RandomForestRegressor
 * @brief Bagged regression trees; the prediction is the mean over trees.
 */
class RandomForestRegressor final : public IRegressor {
public:
	friend class RandomForestBuilder;

	void fit(const Eigen::MatrixXd &x, const Eigen::VectorXd &y,
	         const utils::CancellationToken &token = utils::CancellationToken()) override;
	Eigen::VectorXd predict(const Eigen::MatrixXd &x) const override;

	std::string getName() const override {
		return "RandomForest";
	}

	std::size_t treeCount() const {
		return trees_.size();
	}

private:
	RandomForestRegressor(std::size_t n_estimators, RegressionTree::Options tree_options, bool bootstrap,
	                      unsigned seed);

	std::size_t n_estimators_;
	RegressionTree::Options tree_options_;
	bool bootstrap_;
	unsigned seed_;
	std::vector<RegressionTree> trees_;
};

/// Defaults: 100 trees of depth at most 10 on bootstrap samples, seed 42.
class RandomForestBuilder {
public:
	RandomForestBuilder &withEstimators(std::size_t n_estimators);
	RandomForestBuilder &withMaxDepth(std::size_t max_depth);
	RandomForestBuilder &withMinSamplesLeaf(std::size_t min_samples_leaf);
	RandomForestBuilder &withBootstrap(bool bootstrap);
	RandomForestBuilder &withSeed(unsigned seed);
	std::unique_ptr<RandomForestRegressor> build();

private:
	std::size_t n_estimators_ = 100;
	RegressionTree::Options tree_options_;
	bool bootstrap_ = true;
	unsigned seed_ = 42;
};

} // namespace entitypulse::models
