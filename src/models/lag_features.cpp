#include "entity-pulse/models/lag_features.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace entitypulse::models {

LagFeatures::LagFeatures(std::vector<int> lags) : lags_(std::move(lags)) {
	if (lags_.empty()) {
		throw std::invalid_argument("At least one lag is required.");
	}
	for (int lag : lags_) {
		if (lag < 1) {
			throw std::invalid_argument("Lags must be positive.");
		}
	}
	max_lag_ = static_cast<std::size_t>(*std::max_element(lags_.begin(), lags_.end()));
}

LagDesign LagFeatures::design(const std::vector<double> &history) const {
	LagDesign design;
	const std::size_t rows = history.size() > max_lag_ ? history.size() - max_lag_ : 0;
	design.x.resize(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(lags_.size()));
	design.y.resize(static_cast<Eigen::Index>(rows));
	for (std::size_t r = 0; r < rows; ++r) {
		const std::size_t t = r + max_lag_;
		for (std::size_t c = 0; c < lags_.size(); ++c) {
			design.x(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) =
			    history[t - static_cast<std::size_t>(lags_[c])];
		}
		design.y[static_cast<Eigen::Index>(r)] = history[t];
	}
	return design;
}

Eigen::RowVectorXd LagFeatures::nextRow(const std::vector<double> &history) const {
	Eigen::RowVectorXd row(static_cast<Eigen::Index>(lags_.size()));
	for (std::size_t c = 0; c < lags_.size(); ++c) {
		const auto lag = static_cast<std::size_t>(lags_[c]);
		row[static_cast<Eigen::Index>(c)] = lag <= history.size() ? history[history.size() - lag] : 0.0;
	}
	return row;
}

LagFeatureForecaster::LagFeatureForecaster(std::unique_ptr<IRegressor> regressor, LagFeatures features)
    : regressor_(std::move(regressor)), features_(std::move(features)) {
	if (!regressor_) {
		throw std::invalid_argument("LagFeatureForecaster requires a regressor.");
	}
}

void LagFeatureForecaster::fit(const core::TimeSeries &ts) {
	const auto design = features_.design(ts.getValues());
	if (static_cast<std::size_t>(design.x.rows()) < kMinRows) {
		throw std::invalid_argument("Not enough observations to train a lag-feature model.");
	}
	regressor_->fit(design.x, design.y, cancellationToken());
	history_ = ts.getValues();
	is_fitted_ = true;
}

std::vector<double> LagFeatureForecaster::predict(int horizon) {
	if (!is_fitted_) {
		throw std::runtime_error(getName() + "::predict called before fit.");
	}
	std::vector<double> forecast;
	if (horizon <= 0) {
		return forecast;
	}
	forecast.reserve(static_cast<std::size_t>(horizon));
	std::vector<double> history = history_;
	for (int h = 0; h < horizon; ++h) {
		const Eigen::MatrixXd row = features_.nextRow(history);
		// Mention counts cannot fall below zero, and neither can the value fed into later lags.
		const double next = std::max(0.0, regressor_->predict(row)[0]);
		forecast.push_back(next);
		history.push_back(next);
	}
	return forecast;
}

} // namespace entitypulse::models
