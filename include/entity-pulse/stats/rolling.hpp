#pragma once

#include <cstddef>
#include <vector>

namespace entitypulse::stats {

/**
 * @struct RollingBaseline
 * @brief Per-index mean and sample standard deviation of a trailing window.
 *
 * The window for index i covers the up-to-`window` values strictly before i. Index 0 has no
 * history; its baseline mean is the value itself and its std is 0, so it always scores 0.
 */
struct RollingBaseline {
	std::vector<double> mean;
	std::vector<double> stdev;
	std::vector<std::size_t> count;
};

RollingBaseline trailingBaseline(const std::vector<double> &values, std::size_t window);

/// Mean and sample std of values[begin, end).
void windowMoments(const std::vector<double> &values, std::size_t begin, std::size_t end, double &mean,
                   double &stdev);

/**
 * @brief Standardised deviation of each value from its trailing baseline.
 * @return (value - mean) / (std + epsilon) per index; exactly 0 where value equals the baseline mean.
 */
std::vector<double> deviationScores(const std::vector<double> &values, const RollingBaseline &baseline,
                                    double epsilon = 1e-10);

} // namespace entitypulse::stats
