#pragma once

#include "entity-pulse/utils/cancellation.hpp"

#include <Eigen/Dense>
#include <optional>

namespace entitypulse::detectors {

/**
 * @class OneClassSVM
 * @brief Schölkopf's one-class SVM with an RBF kernel, trained by SMO.
 *
 * Solves min 1/2 a'Ka subject to 0 <= a_i <= 1 and sum(a) = nu * n. The decision function
 * f(x) = sum_i a_i K(x_i, x) - rho is negative outside the learnt support.
 */
class OneClassSVM {
public:
	struct Options {
		double nu = 0.05;
		/// RBF width; unset selects 1 / (n_features * var(X)).
		std::optional<double> gamma;
		double tolerance = 1e-3;
		int max_iterations = 100000;
	};

	OneClassSVM();
	explicit OneClassSVM(Options options);

	void fit(const Eigen::MatrixXd &x, const utils::CancellationToken &token = utils::CancellationToken());

	Eigen::VectorXd decisionFunction(const Eigen::MatrixXd &x) const;

	double rho() const {
		return rho_;
	}
	double gamma() const {
		return gamma_;
	}
	const Eigen::VectorXd &alphas() const {
		return alpha_;
	}

private:
	Eigen::MatrixXd kernel(const Eigen::MatrixXd &a, const Eigen::MatrixXd &b) const;

	Options options_;
	Eigen::MatrixXd support_;
	Eigen::VectorXd alpha_;
	double gamma_ = 1.0;
	double rho_ = 0.0;
	bool fitted_ = false;
};

} // namespace entitypulse::detectors
