#pragma once

#include "entity-pulse/models/regressor.hpp"
#include "entity-pulse/utils/metrics.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace entitypulse::prediction {

struct ForestParameters {
	std::size_t n_estimators = 100;
	std::size_t max_depth = 10;

	/// Seeded forest with these settings and the remaining defaults.
	std::unique_ptr<models::IRegressor> build() const;
};

struct SVRParameters {
	double c = 1.0;
	double epsilon = 0.1;
	/// Unset selects gamma = 1 / (n_features * var(X)).
	std::optional<double> gamma;

	std::unique_ptr<models::IRegressor> build() const;
};

/**
 * @struct TuningGrid
 * @brief Candidate values searched by Predictor::tuneModels().
 *
 * Every combination of a model's lists is one candidate.
 */
struct TuningGrid {
	std::vector<std::size_t> forest_estimators{50, 100, 200};
	std::vector<std::size_t> forest_max_depth{5, 10, 20};
	std::vector<double> svr_c{0.1, 1.0, 10.0, 100.0};
	std::vector<double> svr_epsilon{0.01, 0.1, 0.2, 0.5};
	std::vector<std::optional<double>> svr_gamma{std::nullopt, 0.01, 0.1, 1.0};

	std::vector<ForestParameters> forestCandidates() const;
	std::vector<SVRParameters> svrCandidates() const;

	void validate() const;
};

/// Best candidate of one model family, or why none could be scored.
template <typename Parameters>
struct TuningResult {
	Parameters best;
	/// Cross-validated metrics of the best candidate; candidates are ranked by MSE.
	utils::AccuracyMetrics metrics;
	/// Candidates that were scored without error.
	std::size_t evaluated = 0;
	std::string error;

	bool succeeded() const {
		return error.empty();
	}
};

struct TuningReport {
	std::string entity;
	std::size_t points = 0;
	/// Both unset when the history is shorter than PredictorConfig::min_cv_points.
	std::optional<TuningResult<ForestParameters>> random_forest;
	std::optional<TuningResult<SVRParameters>> kernel_svr;

	/// "RandomForest" or "KernelSVR", whichever succeeded with the lower MSE; empty if neither did.
	std::string bestModel() const;
};

} // namespace entitypulse::prediction
