#include "entity-pulse/models/arima.hpp"
#include "entity-pulse/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace entitypulse::models {

namespace {

constexpr int kRefinementPasses = 5;
constexpr double kPi = 3.14159265358979323846;

Eigen::VectorXd autocorr(const std::vector<double> &data, int max_lag) {
	const int n = static_cast<int>(data.size());
	Eigen::VectorXd acf = Eigen::VectorXd::Zero(max_lag + 1);
	if (n == 0) {
		return acf;
	}

	const double mean = std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(n);
	double variance = 0.0;
	for (double val : data) {
		variance += (val - mean) * (val - mean);
	}
	if (variance == 0.0) {
		return acf;
	}

	acf[0] = 1.0;
	for (int lag = 1; lag <= max_lag; ++lag) {
		double covariance = 0.0;
		for (int i = lag; i < n; ++i) {
			covariance += (data[i] - mean) * (data[i - lag] - mean);
		}
		acf[lag] = covariance / variance;
	}
	return acf;
}

// Yule-Walker equations R * phi = r over the sample autocorrelations.
Eigen::VectorXd estimate_ar_params(const std::vector<double> &data, int p) {
	if (p == 0) {
		return Eigen::VectorXd();
	}
	if (static_cast<int>(data.size()) <= p) {
		throw std::invalid_argument("Not enough data to estimate AR parameters.");
	}

	const Eigen::VectorXd acf = autocorr(data, p);
	Eigen::MatrixXd R(p, p);
	for (int i = 0; i < p; ++i) {
		for (int j = 0; j < p; ++j) {
			R(i, j) = acf[std::abs(i - j)];
		}
	}
	const Eigen::VectorXd r = acf.segment(1, p);
	return R.colPivHouseholderQr().solve(r);
}

void fit_ma_component(const std::vector<double> &residuals, std::size_t skip, Eigen::VectorXd &ma_coeffs) {
	const std::size_t n = residuals.size();
	for (Eigen::Index idx = 0; idx < ma_coeffs.size(); ++idx) {
		const auto lag = static_cast<std::size_t>(idx + 1);
		double numerator = 0.0;
		double denominator = 0.0;
		for (std::size_t t = skip + lag; t < n; ++t) {
			numerator += residuals[t] * residuals[t - lag];
			denominator += residuals[t] * residuals[t];
		}
		if (denominator == 0.0) {
			ma_coeffs[idx] = 0.0;
			continue;
		}
		ma_coeffs[idx] = numerator / denominator;
		if (!std::isfinite(ma_coeffs[idx])) {
			throw std::runtime_error("Invalid MA coefficient detected during estimation.");
		}
		ma_coeffs[idx] = std::clamp(ma_coeffs[idx], -0.99, 0.99);
	}
}

std::string format_coefficients(const Eigen::VectorXd &coeffs) {
	std::stringstream ss;
	ss << coeffs.transpose();
	return ss.str();
}

} // namespace

ARIMA::ARIMA(int p, int d, int q, bool include_intercept)
    : p_(p), d_(d), q_(q), include_intercept_(include_intercept) {
	if (p < 0 || d < 0 || q < 0) {
		throw std::invalid_argument("ARIMA orders (p, d, q) must be non-negative.");
	}
	if (p == 0 && q == 0) {
		throw std::invalid_argument("At least one of p or q must be greater than zero for ARIMA.");
	}
}

std::vector<double> ARIMA::difference(const std::vector<double> &data, int d) {
	if (d == 0) {
		return data;
	}
	if (data.size() <= static_cast<std::size_t>(d)) {
		throw std::invalid_argument("Insufficient data length for requested differencing order.");
	}
	std::vector<double> result = data;
	for (int order = 0; order < d; ++order) {
		std::adjacent_difference(result.begin(), result.end(), result.begin());
		result.erase(result.begin());
	}
	return result;
}

std::vector<double> ARIMA::integrate(const std::vector<double> &forecast_diff, const std::vector<double> &last_values,
                                     int d) {
	if (d == 0) {
		return forecast_diff;
	}
	if (last_values.size() < static_cast<std::size_t>(d)) {
		throw std::invalid_argument("Insufficient history retained to integrate differenced forecast.");
	}

	// The last observation of the series differenced 0 .. d-1 times.
	std::vector<double> anchors;
	std::vector<double> level = last_values;
	for (int k = 0; k < d; ++k) {
		anchors.push_back(level.back());
		std::adjacent_difference(level.begin(), level.end(), level.begin());
		level.erase(level.begin());
	}

	std::vector<double> result = forecast_diff;
	for (int k = d - 1; k >= 0; --k) {
		double previous = anchors[static_cast<std::size_t>(k)];
		for (double &value : result) {
			previous += value;
			value = previous;
		}
	}
	return result;
}

double ARIMA::predictDifferenced(std::size_t t) const {
	double prediction = intercept_;
	for (int i = 0; i < p_; ++i) {
		if (t > static_cast<std::size_t>(i)) {
			prediction += ar_coeffs_[i] * differenced_history_[t - static_cast<std::size_t>(i) - 1];
		}
	}
	for (int i = 0; i < q_; ++i) {
		if (t > static_cast<std::size_t>(i)) {
			prediction += ma_coeffs_[i] * residuals_[t - static_cast<std::size_t>(i) - 1];
		}
	}
	return prediction;
}

void ARIMA::fit(const core::TimeSeries &ts) {
	const std::size_t min_required = static_cast<std::size_t>(std::max(p_ + d_, q_ + d_) + 2);
	if (ts.size() < min_required) {
		throw std::invalid_argument("Insufficient data for the given ARIMA order.");
	}

	const auto &history = ts.getValues();
	differenced_history_ = difference(history, d_);
	const std::size_t n = differenced_history_.size();
	const auto skip = static_cast<std::size_t>(std::max(p_, q_));

	const std::size_t retain = std::min(history.size(), static_cast<std::size_t>(d_ + 1));
	last_values_.assign(history.end() - static_cast<std::ptrdiff_t>(retain), history.end());

	mean_ = std::accumulate(differenced_history_.begin(), differenced_history_.end(), 0.0) / static_cast<double>(n);
	ar_coeffs_ = estimate_ar_params(differenced_history_, p_);
	ma_coeffs_ = Eigen::VectorXd::Zero(q_);
	residuals_.assign(n, 0.0);

	const auto update_intercept = [this]() {
		intercept_ = include_intercept_ ? mean_ * (1.0 - ar_coeffs_.sum()) : 0.0;
	};
	const auto update_residuals = [this, n, skip]() {
		for (std::size_t t = skip; t < n; ++t) {
			residuals_[t] = differenced_history_[t] - predictDifferenced(t);
		}
	};

	update_intercept();
	update_residuals();
	if (q_ > 0) {
		for (int pass = 0; pass < kRefinementPasses; ++pass) {
			cancellationToken().throwIfCancelled("ARIMA::fit");
			fit_ma_component(residuals_, skip, ma_coeffs_);
			update_residuals();
		}
	}

	const std::size_t effective = n > skip ? n - skip : 0;
	double sum_sq = 0.0;
	for (std::size_t t = skip; t < n; ++t) {
		sum_sq += residuals_[t] * residuals_[t];
	}
	sigma2_ = effective > 0 ? sum_sq / static_cast<double>(effective) : 0.0;
	if (sigma2_ > 0.0) {
		const double loglik =
		    -0.5 * static_cast<double>(effective) * (std::log(2.0 * kPi * sigma2_) + 1.0);
		const int k = p_ + q_ + (include_intercept_ ? 1 : 0);
		aic_ = -2.0 * loglik + 2.0 * static_cast<double>(k);
	} else {
		aic_.reset();
	}

	is_fitted_ = true;
	ENTITYPULSE_DEBUG("ARIMA({},{},{}) fitted on {} observations.", p_, d_, q_, ts.size());
	if (p_ > 0) {
		ENTITYPULSE_DEBUG("AR coeffs: [{}]", format_coefficients(ar_coeffs_));
	}
	if (q_ > 0) {
		ENTITYPULSE_DEBUG("MA coeffs: [{}]", format_coefficients(ma_coeffs_));
	}
	ENTITYPULSE_DEBUG("Intercept: {}", intercept_);
}

std::vector<double> ARIMA::predict(int horizon) {
	if (!is_fitted_) {
		throw std::runtime_error("ARIMA::predict called before fit.");
	}
	if (horizon <= 0) {
		return {};
	}

	std::vector<double> history = differenced_history_;
	std::vector<double> residuals = residuals_;
	std::vector<double> diff_forecast;
	diff_forecast.reserve(static_cast<std::size_t>(horizon));
	for (int h = 0; h < horizon; ++h) {
		double next_value = intercept_;
		for (int i = 0; i < p_; ++i) {
			if (history.size() > static_cast<std::size_t>(i)) {
				next_value += ar_coeffs_[i] * history[history.size() - static_cast<std::size_t>(i) - 1];
			}
		}
		for (int i = 0; i < q_; ++i) {
			if (residuals.size() > static_cast<std::size_t>(i)) {
				next_value += ma_coeffs_[i] * residuals[residuals.size() - static_cast<std::size_t>(i) - 1];
			}
		}
		diff_forecast.push_back(next_value);
		history.push_back(next_value);
		residuals.push_back(0.0);
	}
	return integrate(diff_forecast, last_values_, d_);
}

ARIMABuilder &ARIMABuilder::withAR(int p) {
	p_ = p;
	return *this;
}

ARIMABuilder &ARIMABuilder::withDifferencing(int d) {
	d_ = d;
	return *this;
}

ARIMABuilder &ARIMABuilder::withMA(int q) {
	q_ = q;
	return *this;
}

ARIMABuilder &ARIMABuilder::withIntercept(bool include_intercept) {
	include_intercept_ = include_intercept;
	return *this;
}

std::unique_ptr<ARIMA> ARIMABuilder::build() {
	return std::unique_ptr<ARIMA>(new ARIMA(p_, d_, q_, include_intercept_));
}

} // namespace entitypulse::models
