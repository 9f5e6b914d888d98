#pragma once

#include "entity-pulse/core/date.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace entitypulse::prediction {

struct ForecastPoint {
	core::Date date;
	double value = 0.0;
};

/**
 * @struct ForecastResult
 * @brief Forecast of one model for one entity, ordered by date.
 */
struct ForecastResult {
	std::string entity;
	std::string model;
	std::vector<ForecastPoint> points;

	bool empty() const {
		return points.empty();
	}

	/// Forecast value for @p date, if the model produced one.
	std::optional<double> valueAt(const core::Date &date) const;
};

/// What one forecasting strategy produced: a forecast, or the message of the error that stopped it.
struct ModelOutcome {
	std::string model;
	std::optional<ForecastResult> forecast;
	std::string error;

	bool succeeded() const {
		return forecast.has_value();
	}
};

struct PredictedEvent {
	std::string entity;
	core::Date date;
	double value = 0.0;
	/// min(1, value / (2 * threshold)).
	double confidence = 0.0;
};

/**
 * @brief Averages the successful outcomes date by date.
 *
 * Each date of the result holds the mean over exactly the models that forecast it; failed
 * outcomes contribute nothing. The result is named "ensemble" and is empty when every outcome
 * failed.
 */
ForecastResult combineEnsemble(const std::string &entity, const std::vector<ModelOutcome> &outcomes);

/**
 * @brief Emits an event at every date of @p ensemble that reaches @p threshold and is a strict peak.
 *
 * A date is a peak when no forecast value within @p neighbour_window days before or after it is
 * greater than or equal to its own. Dates outside the forecast are not compared.
 *
 * @throws core::InvalidParameter for a non-positive threshold or a zero window.
 */
std::vector<PredictedEvent> detectPredictedEvents(const ForecastResult &ensemble, double threshold,
                                                  std::size_t neighbour_window = 1);

} // namespace entitypulse::prediction
