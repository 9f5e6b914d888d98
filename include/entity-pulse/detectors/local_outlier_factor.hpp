#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <vector>

namespace entitypulse::detectors {

/**
 * @class LocalOutlierFactor
 * @brief Density-based outlier score (Breunig et al., 2000).
 *
 * LOF around 1 means a point is as dense as its neighbours; clearly larger values mark
 * points in sparser regions.
 */
class LocalOutlierFactor {
public:
	explicit LocalOutlierFactor(std::size_t n_neighbors = 20);

	/// Fits on @p x and computes the training scores with each point excluded from its own neighbourhood.
	void fit(const Eigen::MatrixXd &x);

	const Eigen::VectorXd &trainingScores() const {
		return training_scores_;
	}

	/// LOF of new points relative to the training data.
	Eigen::VectorXd score(const Eigen::MatrixXd &queries) const;

	std::size_t effectiveNeighbors() const {
		return k_;
	}

private:
	std::vector<std::size_t> nearest(const Eigen::VectorXd &distances, std::size_t k,
	                                 std::ptrdiff_t exclude) const;

	std::size_t n_neighbors_;
	std::size_t k_ = 0;
	Eigen::MatrixXd train_;
	Eigen::VectorXd k_distance_;
	Eigen::VectorXd lrd_;
	Eigen::VectorXd training_scores_;
};

} // namespace entitypulse::detectors
