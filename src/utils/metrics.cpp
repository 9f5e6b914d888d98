#include "entity-pulse/utils/metrics.hpp"

#include <cmath>
#include <stdexcept>

namespace entitypulse::utils {

namespace {

void require_aligned(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.empty() || actual.size() != predicted.size()) {
		throw std::invalid_argument("Actual and predicted vectors must be non-empty and of equal length.");
	}
}

struct OptionalMean {
	double sum = 0.0;
	std::size_t count = 0;

	void add(const std::optional<double> &value) {
		if (value) {
			sum += *value;
			++count;
		}
	}
	std::optional<double> get() const {
		if (count == 0) {
			return std::nullopt;
		}
		return sum / static_cast<double>(count);
	}
};

} // namespace

double Metrics::mae(const std::vector<double> &actual, const std::vector<double> &predicted) {
	require_aligned(actual, predicted);
	double sum = 0.0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		sum += std::abs(actual[i] - predicted[i]);
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::mse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	require_aligned(actual, predicted);
	double sum = 0.0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		const double diff = actual[i] - predicted[i];
		sum += diff * diff;
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::rmse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return std::sqrt(mse(actual, predicted));
}

std::optional<double> Metrics::mape(const std::vector<double> &actual, const std::vector<double> &predicted) {
	require_aligned(actual, predicted);
	double sum = 0.0;
	std::size_t count = 0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		const double denom = std::abs(actual[i]);
		if (denom > std::numeric_limits<double>::epsilon()) {
			sum += std::abs(actual[i] - predicted[i]) / denom;
			++count;
		}
	}
	if (count == 0) {
		return std::nullopt;
	}
	return sum / static_cast<double>(count) * 100.0;
}

std::optional<double> Metrics::r2(const std::vector<double> &actual, const std::vector<double> &predicted) {
	require_aligned(actual, predicted);
	double mean = 0.0;
	for (double value : actual) {
		mean += value;
	}
	mean /= static_cast<double>(actual.size());

	double ss_tot = 0.0;
	double ss_res = 0.0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		ss_tot += (actual[i] - mean) * (actual[i] - mean);
		ss_res += (actual[i] - predicted[i]) * (actual[i] - predicted[i]);
	}
	if (ss_tot <= std::numeric_limits<double>::epsilon()) {
		return std::nullopt;
	}
	return 1.0 - ss_res / ss_tot;
}

double Metrics::bias(const std::vector<double> &actual, const std::vector<double> &predicted) {
	require_aligned(actual, predicted);
	double sum = 0.0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		sum += predicted[i] - actual[i];
	}
	return sum / static_cast<double>(actual.size());
}

AccuracyMetrics Metrics::evaluate(const std::vector<double> &actual, const std::vector<double> &predicted) {
	AccuracyMetrics metrics;
	metrics.n = actual.size();
	metrics.mae = mae(actual, predicted);
	metrics.mse = mse(actual, predicted);
	metrics.rmse = std::sqrt(metrics.mse);
	metrics.mape = mape(actual, predicted);
	metrics.r_squared = r2(actual, predicted);
	return metrics;
}

AccuracyMetrics Metrics::average(const std::vector<AccuracyMetrics> &folds) {
	AccuracyMetrics result;
	if (folds.empty()) {
		return result;
	}
	result.mae = result.mse = result.rmse = 0.0;
	OptionalMean mape;
	OptionalMean r_squared;
	for (const auto &fold : folds) {
		result.mae += fold.mae;
		result.mse += fold.mse;
		result.rmse += fold.rmse;
		result.n += fold.n;
		mape.add(fold.mape);
		r_squared.add(fold.r_squared);
	}
	const auto count = static_cast<double>(folds.size());
	result.mae /= count;
	result.mse /= count;
	result.rmse /= count;
	result.mape = mape.get();
	result.r_squared = r_squared.get();
	return result;
}

} // namespace entitypulse::utils
