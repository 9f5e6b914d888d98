#pragma once

#include "entity-pulse/core/time_series.hpp"

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace entitypulse::detectors {

/**
 * @struct FeatureMatrix
 * @brief Per-day feature rows used by the model-based anomaly strategies.
 *
 * Columns: the value itself, lags 1, 2, 3 and 7 (each only when the series is longer than the
 * lag), the inclusive 7-day rolling mean and std (series longer than 7 days), and the weekday
 * for calendar-indexed series. Rows with an undefined feature are dropped; row_index maps each
 * remaining row back to its series index.
 */
struct FeatureMatrix {
	std::vector<std::string> columns;
	Eigen::MatrixXd values;
	std::vector<std::size_t> row_index;

	std::size_t rows() const {
		return row_index.size();
	}
	bool empty() const {
		return row_index.empty();
	}
};

FeatureMatrix buildAnomalyFeatures(const core::TimeSeries &ts);

/**
 * @struct ColumnScaler
 * @brief Column standardisation learnt on a training matrix.
 *
 * Zero-variance columns are centred but not scaled.
 */
struct ColumnScaler {
	Eigen::RowVectorXd mean;
	Eigen::RowVectorXd scale;

	static ColumnScaler fit(const Eigen::MatrixXd &x);
	Eigen::MatrixXd transform(const Eigen::MatrixXd &x) const;
};

/// Squared Euclidean distances between the rows of @p a and the rows of @p b.
Eigen::MatrixXd squaredDistances(const Eigen::MatrixXd &a, const Eigen::MatrixXd &b);

} // namespace entitypulse::detectors
