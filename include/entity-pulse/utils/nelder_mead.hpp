#pragma once

#include "entity-pulse/utils/cancellation.hpp"

#include <functional>
#include <limits>
#include <vector>

namespace entitypulse::utils {

/**
 * @class NelderMeadOptimizer
 * @brief Derivative-free simplex minimisation with optional box bounds.
 *
 * Used to fit smoothing parameters, where the objective is an in-sample error that is cheap
 * to evaluate but has no convenient gradient.
 */
class NelderMeadOptimizer {
public:
	using Objective = std::function<double(const std::vector<double> &)>;

	struct Options {
		double alpha = 1.0; // reflection
		double gamma = 2.0; // expansion
		double rho = 0.5;   // contraction
		double sigma = 0.5; // shrink
		double step = 0.05; // initial simplex step
		int max_iterations = 500;
		/// Stop once the spread of objective values across the simplex falls below this.
		double tolerance = 1e-6;
	};

	struct Result {
		std::vector<double> best;
		double value = std::numeric_limits<double>::quiet_NaN();
		int iterations = 0;
		bool converged = false;
	};

	/**
	 * @brief Minimises @p objective starting from @p initial.
	 *
	 * Bounds, when given, must have the size of @p initial; every evaluated point is clamped to
	 * them. The token is polled once per iteration.
	 *
	 * @throws TaskCancelled when @p token is cancelled or expires.
	 * @throws std::invalid_argument when the bounds do not match the dimension.
	 */
	Result minimize(const Objective &objective, const std::vector<double> &initial, const Options &options,
	                const std::vector<double> &lower_bounds = {}, const std::vector<double> &upper_bounds = {},
	                const CancellationToken &token = CancellationToken()) const;

private:
	struct Vertex {
		std::vector<double> point;
		double value = 0.0;
	};

	static void clamp(std::vector<double> &point, const std::vector<double> &lower, const std::vector<double> &upper);
	static double spread(const std::vector<Vertex> &simplex);
};

} // namespace entitypulse::utils
