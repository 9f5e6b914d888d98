#include "entity-pulse/detectors/feature_matrix.hpp"

#include <cmath>
#include <limits>

namespace entitypulse::detectors {

namespace {

constexpr std::size_t rolling_window = 7;
const std::size_t feature_lags[] = {1, 2, 3, 7};

} // namespace

FeatureMatrix buildAnomalyFeatures(const core::TimeSeries &ts) {
	FeatureMatrix features;
	const std::size_t n = ts.size();
	if (n == 0) {
		return features;
	}
	const auto &values = ts.getValues();
	const double nan = std::numeric_limits<double>::quiet_NaN();

	std::vector<std::vector<double>> columns;
	features.columns.push_back("value");
	columns.push_back(values);

	for (std::size_t lag : feature_lags) {
		if (n <= lag) {
			continue;
		}
		std::vector<double> column(n, nan);
		for (std::size_t i = lag; i < n; ++i) {
			column[i] = values[i - lag];
		}
		features.columns.push_back("lag_" + std::to_string(lag));
		columns.push_back(std::move(column));
	}

	if (n > rolling_window) {
		std::vector<double> mean_column(n, nan);
		std::vector<double> std_column(n, nan);
		for (std::size_t i = 0; i < n; ++i) {
			const std::size_t begin = i + 1 >= rolling_window ? i + 1 - rolling_window : 0;
			const std::size_t count = i + 1 - begin;
			double sum = 0.0;
			for (std::size_t j = begin; j <= i; ++j) {
				sum += values[j];
			}
			const double mean = sum / static_cast<double>(count);
			mean_column[i] = mean;
			if (count > 1) {
				double accum = 0.0;
				for (std::size_t j = begin; j <= i; ++j) {
					accum += (values[j] - mean) * (values[j] - mean);
				}
				std_column[i] = std::sqrt(accum / static_cast<double>(count - 1));
			}
		}
		features.columns.push_back("rolling_mean_7");
		columns.push_back(std::move(mean_column));
		features.columns.push_back("rolling_std_7");
		columns.push_back(std::move(std_column));
	}

	if (ts.hasCalendar()) {
		std::vector<double> weekday(n);
		for (std::size_t i = 0; i < n; ++i) {
			weekday[i] = static_cast<double>(ts.weekdayAt(i));
		}
		features.columns.push_back("day_of_week");
		columns.push_back(std::move(weekday));
	}

	for (std::size_t i = 0; i < n; ++i) {
		bool complete = true;
		for (const auto &column : columns) {
			if (std::isnan(column[i])) {
				complete = false;
				break;
			}
		}
		if (complete) {
			features.row_index.push_back(i);
		}
	}

	features.values.resize(static_cast<Eigen::Index>(features.row_index.size()),
	                       static_cast<Eigen::Index>(columns.size()));
	for (std::size_t r = 0; r < features.row_index.size(); ++r) {
		for (std::size_t c = 0; c < columns.size(); ++c) {
			features.values(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) =
			    columns[c][features.row_index[r]];
		}
	}
	return features;
}

ColumnScaler ColumnScaler::fit(const Eigen::MatrixXd &x) {
	ColumnScaler scaler;
	scaler.mean = x.colwise().mean();
	scaler.scale = Eigen::RowVectorXd::Ones(x.cols());
	if (x.rows() < 2) {
		return scaler;
	}
	const Eigen::MatrixXd centred = x.rowwise() - scaler.mean;
	for (Eigen::Index c = 0; c < x.cols(); ++c) {
		const double sd = std::sqrt(centred.col(c).squaredNorm() / static_cast<double>(x.rows()));
		if (sd > 0.0) {
			scaler.scale(c) = sd;
		}
	}
	return scaler;
}

Eigen::MatrixXd ColumnScaler::transform(const Eigen::MatrixXd &x) const {
	Eigen::MatrixXd scaled = x.rowwise() - mean;
	return (scaled.array().rowwise() / scale.array()).matrix();
}

Eigen::MatrixXd squaredDistances(const Eigen::MatrixXd &a, const Eigen::MatrixXd &b) {
	const Eigen::VectorXd a_norms = a.rowwise().squaredNorm();
	const Eigen::VectorXd b_norms = b.rowwise().squaredNorm();
	Eigen::MatrixXd d = -2.0 * a * b.transpose();
	d.colwise() += a_norms;
	d.rowwise() += b_norms.transpose();
	return d.cwiseMax(0.0);
}

} // namespace entitypulse::detectors
