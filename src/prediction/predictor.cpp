#include "entity-pulse/prediction/predictor.hpp"
#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/models/arima.hpp"
#include "entity-pulse/models/holt_winters.hpp"
#include "entity-pulse/models/kernel_svr.hpp"
#include "entity-pulse/models/lag_features.hpp"
#include "entity-pulse/models/linear_trend.hpp"
#include "entity-pulse/models/random_forest.hpp"
#include "entity-pulse/utils/cross_validation.hpp"
#include "entity-pulse/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <future>
#include <stdexcept>
#include <utility>

namespace entitypulse::prediction {

namespace {

using RegressorFactory = std::function<std::unique_ptr<models::IRegressor>()>;

struct NamedRegressor {
	std::string name;
	RegressorFactory factory;
};

std::vector<NamedRegressor> evaluation_regressors() {
	return {
	    {"LinearRegression", []() -> std::unique_ptr<models::IRegressor> {
		     return std::make_unique<models::LinearRegression>();
	     }},
	    {"RandomForest", []() -> std::unique_ptr<models::IRegressor> { return models::RandomForestBuilder().build(); }},
	    {"KernelSVR", []() -> std::unique_ptr<models::IRegressor> { return models::KernelSVRBuilder().build(); }},
	};
}

template <typename Parameters>
TuningResult<Parameters> search_grid(const char *family, const std::vector<Parameters> &candidates,
                                     const models::LagDesign &design, int folds,
                                     const utils::CancellationToken &token) {
	TuningResult<Parameters> result;
	try {
		for (const auto &candidate : candidates) {
			token.throwIfCancelled("Predictor::tuneModels");
			utils::AccuracyMetrics metrics;
			try {
				metrics = utils::CrossValidation::evaluate(
				              design.x, design.y, [&candidate]() { return candidate.build(); }, folds, token)
				              .average;
			} catch (const utils::TaskCancelled &) {
				throw;
			} catch (const std::exception &e) {
				ENTITYPULSE_DEBUG("{} candidate skipped: {}", family, e.what());
				continue;
			}
			if (result.evaluated == 0 || metrics.mse < result.metrics.mse) {
				result.best = candidate;
				result.metrics = metrics;
			}
			++result.evaluated;
		}
		if (result.evaluated == 0) {
			result.error = "No " + std::string(family) + " candidate could be evaluated.";
		}
	} catch (const std::exception &e) {
		ENTITYPULSE_WARN("Tuning of {} failed: {}", family, e.what());
		result.error = e.what();
	}
	return result;
}

} // namespace

std::string toString(ForecastStrategy strategy) {
	switch (strategy) {
	case ForecastStrategy::ARIMA:
		return "ARIMA";
	case ForecastStrategy::ExponentialSmoothing:
		return "ExponentialSmoothing";
	case ForecastStrategy::LinearTrend:
		return "LinearTrend";
	case ForecastStrategy::RandomForest:
		return "RandomForest";
	case ForecastStrategy::KernelSVR:
		return "KernelSVR";
	}
	return "Unknown";
}

void PredictorConfig::validate() const {
	if (strategies.empty()) {
		throw core::InvalidParameter("At least one forecasting strategy is required.");
	}
	if (!(event_threshold > 0.0)) {
		throw core::InvalidParameter("Event threshold must be positive.");
	}
	if (event_neighbour_window == 0) {
		throw core::InvalidParameter("Event neighbour window must be at least 1.");
	}
	if (cv_folds < 2) {
		throw core::InvalidParameter("Cross-validation needs at least two folds.");
	}
	// Seven days are consumed by the longest lag; every fold needs at least one test row.
	if (min_cv_points < static_cast<std::size_t>(cv_folds) + 8) {
		throw core::InvalidParameter("min_cv_points is too small for the number of folds.");
	}
	if (task_budget.count() < 0) {
		throw core::InvalidParameter("Task budget must not be negative.");
	}
}

Predictor::Predictor(std::shared_ptr<const data::TimeSeriesProvider> provider, PredictorConfig config,
                     std::shared_ptr<utils::WorkerPool> pool)
    : provider_(std::move(provider)), config_(std::move(config)), pool_(std::move(pool)) {
	if (!provider_) {
		throw core::InvalidParameter("Predictor requires a time series provider.");
	}
	config_.validate();
}

std::unique_ptr<models::IForecaster> Predictor::makeForecaster(ForecastStrategy strategy) {
	switch (strategy) {
	case ForecastStrategy::ARIMA:
		return models::ARIMABuilder().withAR(5).withDifferencing(1).withMA(0).build();
	case ForecastStrategy::ExponentialSmoothing:
		return models::HoltWintersBuilder().withSeasonalPeriod(7).build();
	case ForecastStrategy::LinearTrend:
		return std::make_unique<models::LinearTrend>();
	case ForecastStrategy::RandomForest:
		return std::make_unique<models::LagFeatureForecaster>(models::RandomForestBuilder().build());
	case ForecastStrategy::KernelSVR:
		return std::make_unique<models::LagFeatureForecaster>(models::KernelSVRBuilder().build());
	}
	throw std::invalid_argument("Unknown forecast strategy.");
}

ModelOutcome Predictor::runStrategy(ForecastStrategy strategy, const core::TimeSeries &history, int horizon,
                                    const utils::CancellationToken &token) const {
	ModelOutcome outcome;
	outcome.model = toString(strategy);
	try {
		auto model = makeForecaster(strategy);
		model->setCancellationToken(token);
		model->fit(history);
		token.throwIfCancelled("Predictor::runStrategy");
		const auto values = model->predict(horizon);
		if (values.size() != static_cast<std::size_t>(horizon)) {
			throw std::runtime_error("Model returned " + std::to_string(values.size()) + " values for a horizon of " +
			                         std::to_string(horizon) + ".");
		}

		ForecastResult result;
		result.entity = history.entity();
		result.model = outcome.model;
		result.points.reserve(values.size());
		const core::Date last = history.getDates().back();
		for (std::size_t h = 0; h < values.size(); ++h) {
			if (!std::isfinite(values[h])) {
				throw std::runtime_error("Model produced a non-finite forecast.");
			}
			result.points.push_back(
			    ForecastPoint{last + static_cast<std::int64_t>(h + 1), std::max(0.0, values[h])});
		}
		outcome.forecast = std::move(result);
	} catch (const std::exception &e) {
		ENTITYPULSE_WARN("{} forecast for '{}' failed and is excluded: {}", outcome.model, history.entity(), e.what());
		outcome.error = e.what();
	}
	return outcome;
}

MentionForecast Predictor::forecastSeries(const core::TimeSeries &history, int horizon) const {
	if (horizon <= 0) {
		throw core::InvalidParameter("Forecast horizon must be positive.");
	}
	MentionForecast forecast;
	forecast.entity = history.entity();
	forecast.history = history;
	forecast.ensemble.entity = history.entity();
	forecast.ensemble.model = "ensemble";
	if (history.isEmpty()) {
		ENTITYPULSE_WARN("No history for '{}'; nothing to forecast.", history.entity());
		return forecast;
	}
	if (!history.hasCalendar()) {
		throw core::InvalidParameter("Forecasting needs a calendar-indexed series.");
	}

	std::vector<std::future<ModelOutcome>> pending;
	pending.reserve(config_.strategies.size());
	for (const auto strategy : config_.strategies) {
		pending.push_back(utils::dispatch(
		    pool_,
		    [this, strategy, &history, horizon](const utils::CancellationToken &token) {
			    return runStrategy(strategy, history, horizon, token);
		    },
		    config_.task_budget));
	}
	for (auto &job : pending) {
		forecast.outcomes.push_back(job.get());
	}

	forecast.ensemble = combineEnsemble(history.entity(), forecast.outcomes);
	const auto succeeded = std::count_if(forecast.outcomes.begin(), forecast.outcomes.end(),
	                                     [](const ModelOutcome &outcome) { return outcome.succeeded(); });
	if (succeeded == 0) {
		ENTITYPULSE_WARN("Every forecasting strategy failed for '{}'.", history.entity());
	} else {
		ENTITYPULSE_INFO("Forecast {} days for '{}' with {} of {} strategies.", horizon, history.entity(), succeeded,
		                 forecast.outcomes.size());
	}
	return forecast;
}

MentionForecast Predictor::predictEntityMentions(const std::string &entity, const core::DateRange &range,
                                                 int horizon) const {
	if (horizon <= 0) {
		throw core::InvalidParameter("Forecast horizon must be positive.");
	}
	return forecastSeries(provider_->load(entity, range), horizon);
}

EventPrediction Predictor::predictEntityEvents(const std::string &entity, const core::DateRange &range, int horizon,
                                               double threshold) const {
	if (!(threshold > 0.0)) {
		throw core::InvalidParameter("Event threshold must be positive.");
	}
	EventPrediction prediction;
	prediction.threshold = threshold;
	prediction.forecast = predictEntityMentions(entity, range, horizon);
	if (!prediction.forecast.available()) {
		return prediction;
	}
	prediction.events = detectPredictedEvents(prediction.forecast.ensemble, threshold, config_.event_neighbour_window);
	ENTITYPULSE_INFO("Predicted {} events for '{}'.", prediction.events.size(), entity);
	return prediction;
}

ModelEvaluationReport Predictor::evaluateModels(const std::string &entity, const core::DateRange &range) const {
	const auto history = provider_->load(entity, range);
	ModelEvaluationReport report;
	report.entity = entity;
	report.points = history.size();
	if (history.size() < config_.min_cv_points) {
		ENTITYPULSE_WARN("'{}' has {} points; model evaluation needs at least {}.", entity, history.size(),
		                 config_.min_cv_points);
		return report;
	}

	const auto design = models::LagFeatures().design(history.getValues());
	const int folds = config_.cv_folds;
	std::vector<std::future<ModelEvaluation>> pending;
	for (auto &candidate : evaluation_regressors()) {
		pending.push_back(utils::dispatch(
		    pool_,
		    [&design, folds, candidate](const utils::CancellationToken &token) {
			    ModelEvaluation evaluation;
			    evaluation.model = candidate.name;
			    try {
				    const auto cv = utils::CrossValidation::evaluate(design.x, design.y, candidate.factory, folds, token);
				    evaluation.metrics = cv.average;
				    for (const auto &fold : cv.folds) {
					    evaluation.folds.push_back(fold.metrics);
				    }
			    } catch (const std::exception &e) {
				    ENTITYPULSE_WARN("Evaluation of {} failed: {}", candidate.name, e.what());
				    evaluation.error = e.what();
			    }
			    return evaluation;
		    },
		    config_.task_budget));
	}
	for (auto &job : pending) {
		report.models.push_back(job.get());
	}
	ENTITYPULSE_INFO("Evaluated {} models on {} points of '{}'.", report.models.size(), report.points, entity);
	return report;
}

TuningReport Predictor::tuneModels(const std::string &entity, const core::DateRange &range,
                                   const TuningGrid &grid) const {
	grid.validate();
	const auto history = provider_->load(entity, range);
	TuningReport report;
	report.entity = entity;
	report.points = history.size();
	if (history.size() < config_.min_cv_points) {
		ENTITYPULSE_WARN("'{}' has {} points; tuning needs at least {}.", entity, history.size(),
		                 config_.min_cv_points);
		return report;
	}

	const auto design = models::LagFeatures().design(history.getValues());
	const int folds = config_.cv_folds;
	auto forest = utils::dispatch(
	    pool_,
	    [&design, folds, candidates = grid.forestCandidates()](const utils::CancellationToken &token) {
		    return search_grid("RandomForest", candidates, design, folds, token);
	    },
	    config_.task_budget);
	auto svr = utils::dispatch(
	    pool_,
	    [&design, folds, candidates = grid.svrCandidates()](const utils::CancellationToken &token) {
		    return search_grid("KernelSVR", candidates, design, folds, token);
	    },
	    config_.task_budget);
	forest.wait();
	svr.wait();
	report.random_forest = forest.get();
	report.kernel_svr = svr.get();

	if (report.random_forest->succeeded()) {
		ENTITYPULSE_INFO("Best forest for '{}': {} trees, depth {} (MSE {:.4f}).", entity,
		                 report.random_forest->best.n_estimators, report.random_forest->best.max_depth,
		                 report.random_forest->metrics.mse);
	}
	if (report.kernel_svr->succeeded()) {
		const auto &best = report.kernel_svr->best;
		ENTITYPULSE_INFO("Best SVR for '{}': C {}, epsilon {}, gamma {} (MSE {:.4f}).", entity, best.c, best.epsilon,
		                 best.gamma ? std::to_string(*best.gamma) : std::string("auto"),
		                 report.kernel_svr->metrics.mse);
	}
	return report;
}

std::unique_ptr<models::IForecaster> Predictor::makeTunedForecaster(const TuningReport &report) {
	const auto model = report.bestModel();
	if (model == "RandomForest") {
		return std::make_unique<models::LagFeatureForecaster>(report.random_forest->best.build());
	}
	if (model == "KernelSVR") {
		return std::make_unique<models::LagFeatureForecaster>(report.kernel_svr->best.build());
	}
	throw core::InvalidParameter("No tuned model is available for '" + report.entity + "'.");
}

} // namespace entitypulse::prediction
