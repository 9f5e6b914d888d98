#pragma once

#include "entity-pulse/models/iforecaster.hpp"
#include "entity-pulse/models/regressor.hpp"

#include <memory>
#include <vector>

namespace entitypulse::models {

struct LagDesign {
	Eigen::MatrixXd x;
	Eigen::VectorXd y;
};

/**
 * @class LagFeatures
 * @brief Turns a value history into rows of lagged values.
 */
class LagFeatures {
public:
	explicit LagFeatures(std::vector<int> lags = {1, 2, 3, 7});

	const std::vector<int> &lags() const {
		return lags_;
	}
	std::size_t maxLag() const {
		return max_lag_;
	}

	/// One row per index t >= maxLag() holding history[t - lag] for each lag, with target history[t].
	LagDesign design(const std::vector<double> &history) const;

	/// Features of the day after @p history; lags reaching before its start are 0.
	Eigen::RowVectorXd nextRow(const std::vector<double> &history) const;

private:
	std::vector<int> lags_;
	std::size_t max_lag_ = 0;
};

/**
 * @class LagFeatureForecaster
 * @brief Forecasts with any regressor over lag features, one day at a time.
 *
 * Each prediction is clamped to be non-negative and appended to the history before the next
 * day's features are built.
 */
class LagFeatureForecaster final : public IForecaster {
public:
	/// Fewest training rows accepted after the first maxLag() days are dropped.
	static constexpr std::size_t kMinRows = 10;

	explicit LagFeatureForecaster(std::unique_ptr<IRegressor> regressor, LagFeatures features = LagFeatures());

	void fit(const core::TimeSeries &ts) override;
	std::vector<double> predict(int horizon) override;

	std::string getName() const override {
		return regressor_->getName();
	}

	const IRegressor &regressor() const {
		return *regressor_;
	}
	const LagFeatures &features() const {
		return features_;
	}

private:
	std::unique_ptr<IRegressor> regressor_;
	LagFeatures features_;
	std::vector<double> history_;
	bool is_fitted_ = false;
};

} // namespace entitypulse::models
