#pragma once

#include "entity-pulse/utils/cancellation.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <random>
#include <vector>

namespace entitypulse::detectors {

/**
 * @class IsolationForest
 * @brief Ensemble of random isolation trees (Liu, Ting and Zhou, 2008).
 *
 * Anomaly score s(x) = 2^(-E[h(x)] / c(psi)) lies in (0, 1]; values close to 1 are isolated
 * after few splits and are therefore unusual.
 */
class IsolationForest {
public:
	struct Options {
		std::size_t n_estimators = 100;
		std::size_t max_samples = 256;
		unsigned seed = 42;
	};

	IsolationForest();
	explicit IsolationForest(Options options);

	void fit(const Eigen::MatrixXd &x, const utils::CancellationToken &token = utils::CancellationToken());

	/// s(x) for every row of @p x.
	Eigen::VectorXd anomalyScores(const Eigen::MatrixXd &x) const;

	bool isFitted() const {
		return !trees_.empty();
	}

	/// Average unsuccessful-search path length c(n) of a binary search tree.
	static double averagePathLength(std::size_t n);

private:
	struct Node {
		int feature = -1;
		double split = 0.0;
		int left = -1;
		int right = -1;
		std::size_t size = 0;
	};
	using Tree = std::vector<Node>;

	int grow(Tree &tree, const Eigen::MatrixXd &x, std::vector<Eigen::Index> &rows, std::size_t begin,
	         std::size_t end, std::size_t depth, std::size_t limit, std::mt19937 &rng) const;
	double pathLength(const Tree &tree, const Eigen::Ref<const Eigen::RowVectorXd> &row) const;

	Options options_;
	std::vector<Tree> trees_;
	std::size_t sample_size_ = 0;
};

} // namespace entitypulse::detectors
