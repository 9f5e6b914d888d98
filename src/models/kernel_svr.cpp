#include "entity-pulse/models/kernel_svr.hpp"
#include "entity-pulse/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace entitypulse::models {

namespace {

double soft_threshold(double z, double epsilon) {
	if (z > epsilon) {
		return z - epsilon;
	}
	if (z < -epsilon) {
		return z + epsilon;
	}
	return 0.0;
}

} // namespace

KernelSVR::KernelSVR(double c, double epsilon, std::optional<double> gamma, double tolerance, int max_sweeps)
    : c_(c), epsilon_(epsilon), requested_gamma_(gamma), tolerance_(tolerance), max_sweeps_(max_sweeps) {
	if (c_ <= 0.0) {
		throw std::invalid_argument("KernelSVR C must be positive.");
	}
	if (epsilon_ < 0.0) {
		throw std::invalid_argument("KernelSVR epsilon must not be negative.");
	}
	if (requested_gamma_ && *requested_gamma_ <= 0.0) {
		throw std::invalid_argument("KernelSVR gamma must be positive.");
	}
	if (tolerance_ <= 0.0 || max_sweeps_ < 1) {
		throw std::invalid_argument("KernelSVR needs a positive tolerance and at least one sweep.");
	}
}

Eigen::MatrixXd KernelSVR::kernel(const Eigen::MatrixXd &a, const Eigen::MatrixXd &b) const {
	const Eigen::VectorXd a_sq = a.rowwise().squaredNorm();
	const Eigen::VectorXd b_sq = b.rowwise().squaredNorm();
	Eigen::MatrixXd dist = (-2.0 * a * b.transpose()).colwise() + a_sq;
	dist.rowwise() += b_sq.transpose();
	return ((-gamma_ * dist.array().max(0.0)).exp() + 1.0).matrix();
}

void KernelSVR::fit(const Eigen::MatrixXd &x, const Eigen::VectorXd &y, const utils::CancellationToken &token) {
	if (x.rows() == 0 || x.rows() != y.size()) {
		throw std::invalid_argument("KernelSVR needs a non-empty design matrix matching the target.");
	}
	if (requested_gamma_) {
		gamma_ = *requested_gamma_;
	} else {
		const double mean = x.mean();
		const double variance = (x.array() - mean).square().mean();
		gamma_ = variance > 0.0 ? 1.0 / (static_cast<double>(x.cols()) * variance) : 1.0;
	}

	const Eigen::MatrixXd k = kernel(x, x);
	const Eigen::Index n = x.rows();
	beta_ = Eigen::VectorXd::Zero(n);
	// f = K * beta, maintained incrementally.
	Eigen::VectorXd f = Eigen::VectorXd::Zero(n);

	sweeps_ = 0;
	for (int sweep = 0; sweep < max_sweeps_; ++sweep) {
		token.throwIfCancelled("KernelSVR::fit");
		sweeps_ = sweep + 1;
		double largest_step = 0.0;
		for (Eigen::Index i = 0; i < n; ++i) {
			const double kii = k(i, i);
			const double z = y[i] - f[i] + kii * beta_[i];
			const double updated = std::clamp(soft_threshold(z, epsilon_) / kii, -c_, c_);
			const double delta = updated - beta_[i];
			if (delta != 0.0) {
				f += delta * k.col(i);
				beta_[i] = updated;
				largest_step = std::max(largest_step, std::abs(delta));
			}
		}
		if (largest_step < tolerance_) {
			break;
		}
	}

	support_ = x;
	is_fitted_ = true;
	ENTITYPULSE_DEBUG("KernelSVR fitted: gamma={:.6f}, {} support vectors after {} sweeps.", gamma_,
	                  supportVectorCount(), sweeps_);
}

std::size_t KernelSVR::supportVectorCount() const {
	return static_cast<std::size_t>((beta_.array() != 0.0).count());
}

Eigen::VectorXd KernelSVR::predict(const Eigen::MatrixXd &x) const {
	if (!is_fitted_) {
		throw std::runtime_error("KernelSVR::predict called before fit.");
	}
	if (x.cols() != support_.cols()) {
		throw std::invalid_argument("Feature count differs from the fitted model.");
	}
	return kernel(x, support_) * beta_;
}

KernelSVRBuilder &KernelSVRBuilder::withC(double c) {
	c_ = c;
	return *this;
}

KernelSVRBuilder &KernelSVRBuilder::withEpsilon(double epsilon) {
	epsilon_ = epsilon;
	return *this;
}

KernelSVRBuilder &KernelSVRBuilder::withGamma(double gamma) {
	gamma_ = gamma;
	return *this;
}

KernelSVRBuilder &KernelSVRBuilder::withTolerance(double tolerance) {
	tolerance_ = tolerance;
	return *this;
}

KernelSVRBuilder &KernelSVRBuilder::withMaxSweeps(int max_sweeps) {
	max_sweeps_ = max_sweeps;
	return *this;
}

std::unique_ptr<KernelSVR> KernelSVRBuilder::build() {
	return std::unique_ptr<KernelSVR>(new KernelSVR(c_, epsilon_, gamma_, tolerance_, max_sweeps_));
}

} // namespace entitypulse::models
