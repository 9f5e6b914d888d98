#include "entity-pulse/utils/nelder_mead.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace entitypulse::utils {

namespace {

// a + t * (b - a)
std::vector<double> along(const std::vector<double> &a, const std::vector<double> &b, double t) {
	std::vector<double> result(a.size());
	for (std::size_t i = 0; i < a.size(); ++i) {
		result[i] = a[i] + t * (b[i] - a[i]);
	}
	return result;
}

} // namespace

void NelderMeadOptimizer::clamp(std::vector<double> &point, const std::vector<double> &lower,
                                const std::vector<double> &upper) {
	for (std::size_t i = 0; i < point.size(); ++i) {
		if (!lower.empty()) {
			point[i] = std::max(lower[i], point[i]);
		}
		if (!upper.empty()) {
			point[i] = std::min(upper[i], point[i]);
		}
	}
}

double NelderMeadOptimizer::spread(const std::vector<Vertex> &simplex) {
	double mean = 0.0;
	for (const auto &vertex : simplex) {
		mean += vertex.value;
	}
	mean /= static_cast<double>(simplex.size());
	double accum = 0.0;
	for (const auto &vertex : simplex) {
		accum += (vertex.value - mean) * (vertex.value - mean);
	}
	return std::sqrt(accum / static_cast<double>(simplex.size()));
}

NelderMeadOptimizer::Result NelderMeadOptimizer::minimize(const Objective &objective,
                                                          const std::vector<double> &initial, const Options &options,
                                                          const std::vector<double> &lower_bounds,
                                                          const std::vector<double> &upper_bounds,
                                                          const CancellationToken &token) const {
	Result result;
	if (initial.empty()) {
		return result;
	}
	const std::size_t n = initial.size();
	if ((!lower_bounds.empty() && lower_bounds.size() != n) || (!upper_bounds.empty() && upper_bounds.size() != n)) {
		throw std::invalid_argument("Nelder-Mead bounds must match the number of parameters.");
	}

	const auto evaluate = [&](std::vector<double> point) {
		clamp(point, lower_bounds, upper_bounds);
		const double value = objective(point);
		return Vertex{std::move(point), std::isfinite(value) ? value : std::numeric_limits<double>::max()};
	};
	const auto by_value = [](const Vertex &lhs, const Vertex &rhs) { return lhs.value < rhs.value; };

	std::vector<Vertex> simplex;
	simplex.reserve(n + 1);
	simplex.push_back(evaluate(initial));
	for (std::size_t i = 0; i < n; ++i) {
		auto vertex = initial;
		vertex[i] += options.step;
		simplex.push_back(evaluate(std::move(vertex)));
	}
	std::sort(simplex.begin(), simplex.end(), by_value);

	for (int iter = 0; iter < options.max_iterations; ++iter) {
		token.throwIfCancelled("NelderMeadOptimizer::minimize");
		result.iterations = iter + 1;
		if (spread(simplex) < options.tolerance) {
			result.converged = true;
			break;
		}

		std::vector<double> center(n, 0.0);
		for (std::size_t v = 0; v < n; ++v) {
			for (std::size_t j = 0; j < n; ++j) {
				center[j] += simplex[v].point[j] / static_cast<double>(n);
			}
		}
		const Vertex worst = simplex.back();

		const Vertex reflected = evaluate(along(center, worst.point, -options.alpha));
		if (reflected.value < simplex.front().value) {
			Vertex expanded = evaluate(along(center, reflected.point, options.gamma));
			simplex.back() = expanded.value < reflected.value ? std::move(expanded) : reflected;
		} else if (reflected.value < simplex[n - 1].value) {
			simplex.back() = reflected;
		} else {
			Vertex contracted = evaluate(along(center, worst.point, options.rho));
			if (contracted.value < worst.value) {
				simplex.back() = std::move(contracted);
			} else {
				const auto best = simplex.front().point;
				for (std::size_t v = 1; v < simplex.size(); ++v) {
					simplex[v] = evaluate(along(best, simplex[v].point, options.sigma));
				}
			}
		}
		std::sort(simplex.begin(), simplex.end(), by_value);
	}

	result.best = simplex.front().point;
	result.value = simplex.front().value;
	return result;
}

} // namespace entitypulse::utils
