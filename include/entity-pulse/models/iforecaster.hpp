#pragma once

#include "entity-pulse/core/time_series.hpp"
#include "entity-pulse/utils/cancellation.hpp"

#include <string>
#include <utility>
#include <vector>

namespace entitypulse::models {

/**
 * @class IForecaster
 * @brief An interface for all forecasting models.
 *
 * Models are fitted on the values of a daily series and forecast the days that follow its
 * last observation. Forecasts are raw model output; callers that need non-negative counts
 * clamp them.
 */
class IForecaster {
public:
	virtual ~IForecaster() = default;

	/**
	 * @brief Fits the model to the provided time series data.
	 * @param ts The time series data to train the model on.
	 * @throws std::invalid_argument if the series is too short for the model.
	 */
	virtual void fit(const core::TimeSeries &ts) = 0;

	/**
	 * @brief Generates forecasts for a specified number of steps into the future.
	 * @param horizon The number of future days to predict.
	 * @return One value per day; empty for a non-positive horizon.
	 * @throws std::runtime_error if called before fit().
	 */
	virtual std::vector<double> predict(int horizon) = 0;

	/**
	 * @brief Gets the name of the forecasting model.
	 * @return A string representing the model's name (e.g., "ARIMA").
	 */
	virtual std::string getName() const = 0;

	/// Token polled by iterative fitting procedures.
	void setCancellationToken(utils::CancellationToken token) {
		token_ = std::move(token);
	}

protected:
	const utils::CancellationToken &cancellationToken() const {
		return token_;
	}

private:
	utils::CancellationToken token_;
};

} // namespace entitypulse::models
