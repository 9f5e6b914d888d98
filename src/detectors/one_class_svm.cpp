#include "entity-pulse/detectors/one_class_svm.hpp"
#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/detectors/feature_matrix.hpp"
#include "entity-pulse/utils/logging.hpp"

#include <cmath>
#include <limits>

namespace entitypulse::detectors {

namespace {
constexpr double tau = 1e-12;
constexpr int cancellation_stride = 256;
} // namespace

OneClassSVM::OneClassSVM() : OneClassSVM(Options{}) {
}

OneClassSVM::OneClassSVM(Options options) : options_(options) {
	if (options_.nu <= 0.0 || options_.nu > 1.0) {
		throw core::InvalidParameter("OneClassSVM nu must lie in (0, 1].");
	}
	if (options_.gamma && *options_.gamma <= 0.0) {
		throw core::InvalidParameter("OneClassSVM gamma must be positive.");
	}
	if (options_.tolerance <= 0.0 || options_.max_iterations <= 0) {
		throw core::InvalidParameter("OneClassSVM tolerance and iteration limit must be positive.");
	}
}

Eigen::MatrixXd OneClassSVM::kernel(const Eigen::MatrixXd &a, const Eigen::MatrixXd &b) const {
	return (-gamma_ * squaredDistances(a, b).array()).exp().matrix();
}

void OneClassSVM::fit(const Eigen::MatrixXd &x, const utils::CancellationToken &token) {
	const Eigen::Index n = x.rows();
	if (n == 0) {
		throw core::InvalidParameter("OneClassSVM cannot be fitted on an empty matrix.");
	}
	support_ = x;

	if (options_.gamma) {
		gamma_ = *options_.gamma;
	} else {
		const double mean = x.mean();
		const double variance = (x.array() - mean).square().mean();
		gamma_ = variance > 0.0 ? 1.0 / (static_cast<double>(x.cols()) * variance) : 1.0;
	}

	const Eigen::MatrixXd k = kernel(x, x);
	const double upper = 1.0;
	const double total = options_.nu * static_cast<double>(n);

	alpha_ = Eigen::VectorXd::Zero(n);
	const auto full = static_cast<Eigen::Index>(std::floor(total));
	for (Eigen::Index i = 0; i < std::min(full, n); ++i) {
		alpha_(i) = upper;
	}
	if (full < n) {
		alpha_(full) = total - static_cast<double>(full);
	}

	Eigen::VectorXd gradient = k * alpha_;
	int iteration = 0;
	for (; iteration < options_.max_iterations; ++iteration) {
		if (iteration % cancellation_stride == 0) {
			token.throwIfCancelled("OneClassSVM::fit");
		}
		// Maximal violating pair: move mass from j (largest gradient) to i (smallest gradient).
		Eigen::Index i = -1;
		Eigen::Index j = -1;
		double g_min = std::numeric_limits<double>::infinity();
		double g_max = -std::numeric_limits<double>::infinity();
		for (Eigen::Index t = 0; t < n; ++t) {
			if (alpha_(t) < upper && gradient(t) < g_min) {
				g_min = gradient(t);
				i = t;
			}
			if (alpha_(t) > 0.0 && gradient(t) > g_max) {
				g_max = gradient(t);
				j = t;
			}
		}
		if (i < 0 || j < 0 || g_max - g_min < options_.tolerance) {
			break;
		}

		double curvature = k(i, i) + k(j, j) - 2.0 * k(i, j);
		if (curvature <= 0.0) {
			curvature = tau;
		}
		double delta = (g_max - g_min) / curvature;
		delta = std::min({delta, upper - alpha_(i), alpha_(j)});
		alpha_(i) += delta;
		alpha_(j) -= delta;
		gradient += delta * (k.col(i) - k.col(j));
	}

	// rho from free support vectors, else the midpoint of the feasible interval.
	double free_sum = 0.0;
	int free_count = 0;
	double lower_bound = -std::numeric_limits<double>::infinity();
	double upper_bound = std::numeric_limits<double>::infinity();
	for (Eigen::Index t = 0; t < n; ++t) {
		if (alpha_(t) > 0.0 && alpha_(t) < upper) {
			free_sum += gradient(t);
			++free_count;
		} else if (alpha_(t) >= upper) {
			lower_bound = std::max(lower_bound, gradient(t));
		} else {
			upper_bound = std::min(upper_bound, gradient(t));
		}
	}
	if (free_count > 0) {
		rho_ = free_sum / free_count;
	} else if (std::isfinite(lower_bound) && std::isfinite(upper_bound)) {
		rho_ = 0.5 * (lower_bound + upper_bound);
	} else {
		rho_ = std::isfinite(lower_bound) ? lower_bound : upper_bound;
	}
	fitted_ = true;
	ENTITYPULSE_DEBUG("OneClassSVM converged after {} iterations (rho = {:.6f}).", iteration, rho_);
}

Eigen::VectorXd OneClassSVM::decisionFunction(const Eigen::MatrixXd &x) const {
	if (!fitted_) {
		throw std::runtime_error("OneClassSVM::decisionFunction called before fit.");
	}
	return kernel(x, support_) * alpha_ - Eigen::VectorXd::Constant(x.rows(), rho_);
}

} // namespace entitypulse::detectors
