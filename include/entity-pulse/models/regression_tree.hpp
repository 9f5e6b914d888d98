#pragma once

#include "entity-pulse/models/regressor.hpp"

#include <cstddef>
#include <vector>

namespace entitypulse::models {

/**
 * @class RegressionTree
 * @brief CART regression tree grown by greedy squared-error reduction.
 *
 * Thresholds are midpoints between consecutive distinct feature values. Leaves predict the
 * mean target of their samples.
 */
class RegressionTree final : public IRegressor {
public:
	struct Options {
		std::size_t max_depth = 10;
		std::size_t min_samples_split = 2;
		std::size_t min_samples_leaf = 1;
	};

	RegressionTree();
	explicit RegressionTree(Options options);

	void fit(const Eigen::MatrixXd &x, const Eigen::VectorXd &y,
	         const utils::CancellationToken &token = utils::CancellationToken()) override;

	/// Fits on the given rows only; rows may repeat, as in a bootstrap sample.
	void fit(const Eigen::MatrixXd &x, const Eigen::VectorXd &y, std::vector<Eigen::Index> rows);

	Eigen::VectorXd predict(const Eigen::MatrixXd &x) const override;
	double predictRow(const Eigen::Ref<const Eigen::RowVectorXd> &row) const;

	std::string getName() const override {
		return "RegressionTree";
	}

	std::size_t nodeCount() const {
		return nodes_.size();
	}
	std::size_t depth() const {
		return depth_;
	}

private:
	struct Node {
		int feature = -1;
		double threshold = 0.0;
		int left = -1;
		int right = -1;
		double value = 0.0;
	};

	int grow(const Eigen::MatrixXd &x, const Eigen::VectorXd &y, std::vector<Eigen::Index> &rows, std::size_t begin,
	         std::size_t end, std::size_t depth);

	Options options_;
	std::vector<Node> nodes_;
	std::size_t depth_ = 0;
	Eigen::Index n_features_ = 0;
};

} // namespace entitypulse::models
