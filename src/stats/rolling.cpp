#include "entity-pulse/stats/rolling.hpp"
#include "entity-pulse/core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace entitypulse::stats {

void windowMoments(const std::vector<double> &values, std::size_t begin, std::size_t end, double &mean,
                   double &stdev) {
	const std::size_t n = end - begin;
	mean = 0.0;
	stdev = 0.0;
	if (n == 0) {
		return;
	}
	for (std::size_t i = begin; i < end; ++i) {
		mean += values[i];
	}
	mean /= static_cast<double>(n);
	if (n < 2) {
		return;
	}
	double accum = 0.0;
	for (std::size_t i = begin; i < end; ++i) {
		const double diff = values[i] - mean;
		accum += diff * diff;
	}
	stdev = std::sqrt(accum / static_cast<double>(n - 1));
}

RollingBaseline trailingBaseline(const std::vector<double> &values, std::size_t window) {
	if (window == 0) {
		throw core::InvalidParameter("Rolling window must be at least 1.");
	}
	RollingBaseline baseline;
	const std::size_t n = values.size();
	baseline.mean.resize(n);
	baseline.stdev.resize(n);
	baseline.count.resize(n);

	for (std::size_t i = 0; i < n; ++i) {
		const std::size_t begin = i > window ? i - window : 0;
		baseline.count[i] = i - begin;
		if (i == 0) {
			baseline.mean[i] = values[i];
			baseline.stdev[i] = 0.0;
			continue;
		}
		windowMoments(values, begin, i, baseline.mean[i], baseline.stdev[i]);
	}
	return baseline;
}

std::vector<double> deviationScores(const std::vector<double> &values, const RollingBaseline &baseline,
                                    double epsilon) {
	std::vector<double> scores(values.size(), 0.0);
	for (std::size_t i = 0; i < values.size(); ++i) {
		const double diff = values[i] - baseline.mean[i];
		scores[i] = diff == 0.0 ? 0.0 : diff / (baseline.stdev[i] + epsilon);
	}
	return scores;
}

} // namespace entitypulse::stats
