#pragma once

#include "entity-pulse/models/regressor.hpp"

#include <memory>
#include <optional>

namespace entitypulse::models {

class KernelSVRBuilder;

/**
 * @class KernelSVR
 * @brief Epsilon-insensitive support vector regression with an RBF kernel.
 *
 * The dual is solved by coordinate descent with the bias folded into the kernel
 * (K'(a, b) = K(a, b) + 1), which removes the equality constraint on the dual coefficients.
 * Without an explicit gamma, gamma = 1 / (n_features * var(X)).
 */
class KernelSVR final : public IRegressor {
public:
	friend class KernelSVRBuilder;

	void fit(const Eigen::MatrixXd &x, const Eigen::VectorXd &y,
	         const utils::CancellationToken &token = utils::CancellationToken()) override;
	Eigen::VectorXd predict(const Eigen::MatrixXd &x) const override;

	std::string getName() const override {
		return "KernelSVR";
	}

	double gamma() const {
		return gamma_;
	}
	/// Dual coefficients, one per training row, each within [-C, C].
	const Eigen::VectorXd &dualCoefficients() const {
		return beta_;
	}
	std::size_t supportVectorCount() const;
	int sweeps() const {
		return sweeps_;
	}

private:
	KernelSVR(double c, double epsilon, std::optional<double> gamma, double tolerance, int max_sweeps);

	Eigen::MatrixXd kernel(const Eigen::MatrixXd &a, const Eigen::MatrixXd &b) const;

	double c_;
	double epsilon_;
	std::optional<double> requested_gamma_;
	double tolerance_;
	int max_sweeps_;
	double gamma_ = 0.0;
	Eigen::MatrixXd support_;
	Eigen::VectorXd beta_;
	int sweeps_ = 0;
	bool is_fitted_ = false;
};

/// Defaults: C = 1, epsilon = 0.1, automatic gamma.
class KernelSVRBuilder {
public:
	KernelSVRBuilder &withC(double c);
	KernelSVRBuilder &withEpsilon(double epsilon);
	KernelSVRBuilder &withGamma(double gamma);
	KernelSVRBuilder &withTolerance(double tolerance);
	KernelSVRBuilder &withMaxSweeps(int max_sweeps);
	std::unique_ptr<KernelSVR> build();

private:
	double c_ = 1.0;
	double epsilon_ = 0.1;
	std::optional<double> gamma_;
	double tolerance_ = 1e-4;
	int max_sweeps_ = 1000;
};

} // namespace entitypulse::models
