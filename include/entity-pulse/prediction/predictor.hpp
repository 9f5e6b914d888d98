#pragma once

#include "entity-pulse/data/time_series_provider.hpp"
#include "entity-pulse/models/iforecaster.hpp"
#include "entity-pulse/prediction/ensemble.hpp"
#include "entity-pulse/prediction/tuning.hpp"
#include "entity-pulse/utils/metrics.hpp"
#include "entity-pulse/utils/worker_pool.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace entitypulse::prediction {

enum class ForecastStrategy { ARIMA, ExponentialSmoothing, LinearTrend, RandomForest, KernelSVR };

std::string toString(ForecastStrategy strategy);

struct PredictorConfig {
	/// Strategies run for every forecast, in this order.
	std::vector<ForecastStrategy> strategies{ForecastStrategy::ARIMA, ForecastStrategy::ExponentialSmoothing,
	                                         ForecastStrategy::LinearTrend, ForecastStrategy::RandomForest,
	                                         ForecastStrategy::KernelSVR};
	double event_threshold = 3.0;
	/// Days on each side an event must dominate in the ensemble forecast.
	std::size_t event_neighbour_window = 1;
	int cv_folds = 5;
	/// Shortest history evaluateModels() accepts.
	std::size_t min_cv_points = 30;
	/// Per-strategy time budget; zero disables it.
	std::chrono::milliseconds task_budget{0};

	void validate() const;
};

/**
 * @struct MentionForecast
 * @brief Per-strategy outcomes and their ensemble for one entity.
 */
struct MentionForecast {
	std::string entity;
	core::TimeSeries history;
	std::vector<ModelOutcome> outcomes;
	ForecastResult ensemble;

	/// False when no strategy produced a forecast.
	bool available() const {
		return !ensemble.empty();
	}
};

struct EventPrediction {
	MentionForecast forecast;
	double threshold = 0.0;
	std::vector<PredictedEvent> events;
};

struct ModelEvaluation {
	std::string model;
	/// Averages over the folds; unset members when the evaluation failed.
	utils::AccuracyMetrics metrics;
	std::vector<utils::AccuracyMetrics> folds;
	std::string error;

	bool succeeded() const {
		return error.empty();
	}
};

struct ModelEvaluationReport {
	std::string entity;
	std::size_t points = 0;
	/// Empty when the history is shorter than PredictorConfig::min_cv_points.
	std::vector<ModelEvaluation> models;
};

/**
 * @class Predictor
 * @brief Forecasts mention volume with several independent strategies and their average.
 *
 * Strategies run concurrently when a pool is given. A strategy that throws, or produces a
 * non-finite value, is logged and left out of the ensemble; the others are unaffected.
 * Forecast values are clamped to be non-negative.
 */
class Predictor {
public:
	explicit Predictor(std::shared_ptr<const data::TimeSeriesProvider> provider, PredictorConfig config = {},
	                   std::shared_ptr<utils::WorkerPool> pool = nullptr);

	/**
	 * @brief Forecasts the @p horizon days after the last day of the entity's history.
	 * @throws core::EntityNotFound for an unknown entity.
	 * @throws core::InvalidParameter for a non-positive horizon.
	 */
	MentionForecast predictEntityMentions(const std::string &entity, const core::DateRange &range = {},
	                                      int horizon = 14) const;

	/// Forecast plus the predicted events of its ensemble at @p threshold.
	EventPrediction predictEntityEvents(const std::string &entity, const core::DateRange &range = {},
	                                    int horizon = 14, double threshold = 3.0) const;

	/// Forecasts an already loaded calendar series.
	MentionForecast forecastSeries(const core::TimeSeries &history, int horizon = 14) const;

	/**
	 * @brief Rolling-origin evaluation of the lag-feature regressors on the entity's history.
	 *
	 * Lag features {1, 2, 3, 7} of the history are split into PredictorConfig::cv_folds
	 * expanding folds and linear regression, random forest and kernel SVR are scored one step
	 * ahead on each.
	 */
	ModelEvaluationReport evaluateModels(const std::string &entity, const core::DateRange &range = {}) const;

	/**
	 * @brief Grid search of the random forest and kernel SVR settings on the entity's history.
	 *
	 * Every candidate of @p grid is scored with the same lag-feature cross-validation as
	 * evaluateModels(); the candidate with the lowest mean MSE wins, the earlier one on ties.
	 * A candidate that fails is logged and skipped. Each model family runs as one task under
	 * PredictorConfig::task_budget, and a family cut short by it reports the error.
	 *
	 * @throws core::InvalidParameter for an invalid @p grid.
	 */
	TuningReport tuneModels(const std::string &entity, const core::DateRange &range = {},
	                        const TuningGrid &grid = {}) const;

	/**
	 * @brief Lag-feature forecaster with the winning settings of @p report.
	 * @throws core::InvalidParameter when no model family succeeded.
	 */
	static std::unique_ptr<models::IForecaster> makeTunedForecaster(const TuningReport &report);

	/// A fresh, unfitted model for @p strategy with its default settings.
	static std::unique_ptr<models::IForecaster> makeForecaster(ForecastStrategy strategy);

	const PredictorConfig &config() const {
		return config_;
	}

private:
	ModelOutcome runStrategy(ForecastStrategy strategy, const core::TimeSeries &history, int horizon,
	                         const utils::CancellationToken &token) const;

	std::shared_ptr<const data::TimeSeriesProvider> provider_;
	PredictorConfig config_;
	std::shared_ptr<utils::WorkerPool> pool_;
};

} // namespace entitypulse::prediction
