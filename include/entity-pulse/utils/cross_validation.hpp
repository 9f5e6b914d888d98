#pragma once

#include "entity-pulse/models/regressor.hpp"
#include "entity-pulse/utils/cancellation.hpp"
#include "entity-pulse/utils/metrics.hpp"

#include <Eigen/Dense>
#include <functional>
#include <memory>
#include <vector>

namespace entitypulse::utils {

/**
 * @brief Results from a single CV fold
 */
struct CVFold {
	int fold_id = 0;     // Fold number
	int train_end = 0;   // Training rows are [0, train_end)
	int test_start = 0;  // Start index of test rows
	int test_end = 0;    // End index of test rows (exclusive)

	std::vector<double> predictions;
	std::vector<double> actuals;
	AccuracyMetrics metrics;
};

/**
 * @brief Results from cross-validation
 */
struct CVResults {
	std::vector<CVFold> folds;
	/// Fold metrics averaged with Metrics::average.
	AccuracyMetrics average;
};

/**
 * @brief Expanding-window cross-validation over time-ordered rows.
 *
 * Rows are split the way a time series split does it: with k folds each test block holds
 * n / (k + 1) rows, the blocks are the last k of that size, and every fold trains on all rows
 * before its block. Predictions are one step ahead with the true feature rows.
 */
class CrossValidation {
public:
	/**
	 * @brief Generate CV fold indices
	 *
	 * @param n_samples Total number of rows
	 * @param n_splits Number of folds
	 * @return Folds in time order, without predictions or metrics
	 * @throws std::invalid_argument if n_splits < 2 or n_samples < n_splits + 1
	 */
	static std::vector<CVFold> generateFolds(int n_samples, int n_splits);

	/**
	 * @brief Fits a fresh regressor per fold and scores it on the fold's test rows.
	 *
	 * @param x Feature rows in time order
	 * @param y Targets aligned with @p x
	 * @param factory Creates the regressor for each fold
	 * @param n_splits Number of folds
	 */
	static CVResults evaluate(const Eigen::MatrixXd &x, const Eigen::VectorXd &y,
	                          const std::function<std::unique_ptr<models::IRegressor>()> &factory, int n_splits,
	                          const CancellationToken &token = CancellationToken());
};

} // namespace entitypulse::utils
