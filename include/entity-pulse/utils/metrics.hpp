#pragma once

#include <cstddef>
#include <limits>
#include <optional>
#include <vector>

namespace entitypulse::utils {

/**
 * @struct AccuracyMetrics
 * @brief Point-forecast accuracy over one evaluation window.
 */
struct AccuracyMetrics {
	double mae = std::numeric_limits<double>::quiet_NaN();
	double mse = std::numeric_limits<double>::quiet_NaN();
	double rmse = std::numeric_limits<double>::quiet_NaN();
	/// Undefined when every actual value is zero, which is common for quiet entities.
	std::optional<double> mape;
	/// Undefined when the actual values have no variance.
	std::optional<double> r_squared;
	std::size_t n = 0;
};

/**
 * @class Metrics
 * @brief Error statistics between aligned actual and predicted values.
 *
 * Every function throws std::invalid_argument for empty or unequal-length inputs.
 */
class Metrics final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double mse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static std::optional<double> mape(const std::vector<double> &actual, const std::vector<double> &predicted);
	static std::optional<double> r2(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double bias(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// All of the above in one pass over the inputs' validation.
	static AccuracyMetrics evaluate(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// Element-wise mean of several metric sets; optional members average over the sets that have them.
	static AccuracyMetrics average(const std::vector<AccuracyMetrics> &folds);
};

} // namespace entitypulse::utils
