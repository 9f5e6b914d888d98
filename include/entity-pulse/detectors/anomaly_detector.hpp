#pragma once

#include "entity-pulse/detectors/detection.hpp"
#include "entity-pulse/detectors/feature_matrix.hpp"
#include "entity-pulse/detectors/isolation_forest.hpp"
#include "entity-pulse/detectors/local_outlier_factor.hpp"
#include "entity-pulse/detectors/one_class_svm.hpp"
#include "entity-pulse/utils/cancellation.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace entitypulse::detectors {

/// Interchangeable scoring strategies of the anomaly detector.
enum class AnomalyStrategy { IsolationForest, LocalOutlierFactor, OneClassSVM, ZScore, IQR, MovingAverage };

std::string toString(AnomalyStrategy strategy);
AnomalyStrategy parseAnomalyStrategy(const std::string &name);
DetectionMethod methodOf(AnomalyStrategy strategy);

/// True for the strategies that train a model on the feature matrix.
bool isModelBased(AnomalyStrategy strategy);

struct AnomalyDetectorConfig {
	AnomalyStrategy strategy = AnomalyStrategy::IsolationForest;
	/// Expected share of outliers; the decision boundary of the model strategies.
	double contamination = 0.05;
	double z_threshold = 3.0;
	double iqr_multiplier = 1.5;
	std::size_t moving_average_window = 7;
	double moving_average_threshold = 3.0;
	double contextual_threshold = 3.0;
	std::size_t change_point_window = 7;
	double change_point_threshold = 2.0;
	std::size_t seasonal_period = 7;
	double seasonal_threshold = 3.0;
	std::size_t burst_window = 3;
	double burst_threshold = 2.0;
	std::size_t n_estimators = 100;
	std::size_t n_neighbors = 20;
	unsigned seed = 42;

	void validate() const;
};

/**
 * @struct ContextualAnomalyRecord
 * @brief An anomaly record extended with its deviation from the same weekday's baseline.
 */
struct ContextualAnomalyRecord {
	AnomalyRecord anomaly;
	int day_of_week = 0;
	double contextual_score = 0.0;
	bool contextual_flag = false;
	/// Mean of the strategy score and the contextual score.
	double combined_score = 0.0;
	bool combined_flag = false;
};

/**
 * @struct CombinedDetectionRecord
 * @brief Anomaly, change-point, seasonal and burst scoring of one observation side by side.
 */
struct CombinedDetectionRecord {
	std::size_t index = 0;
	std::optional<core::Date> date;
	double value = 0.0;
	double anomaly_score = 0.0;
	bool anomaly_flag = false;
	double change_point_score = 0.0;
	bool change_point_flag = false;
	double seasonal_score = 0.0;
	bool seasonal_flag = false;
	double burst_score = 0.0;
	bool burst_flag = false;
	/// Arithmetic mean of the four scores.
	double combined_score = 0.0;
	/// True when any of the four flags is set.
	bool is_event = false;
};

/**
 * @class AnomalyDetector
 * @brief Per-series anomaly scoring with six interchangeable strategies.
 *
 * Formula strategies (z-score, IQR, moving average) need no fitting and score every
 * observation. Model strategies (isolation forest, local outlier factor, one-class SVM) are
 * trained by fit() on the lag/rolling feature matrix and score the rows that survive feature
 * construction only.
 *
 * Every score is oriented so that larger means more anomalous. For the model strategies the
 * decision boundary sits at 0.
 */
class AnomalyDetector final : public IDetector {
public:
	explicit AnomalyDetector(AnomalyDetectorConfig config = {});

	/**
	 * @brief Trains the configured model on the series' feature matrix.
	 *
	 * A no-op for formula strategies. A series too short to yield any feature row leaves the
	 * detector without a model; detectAnomalies() then returns an empty result for it.
	 */
	AnomalyDetector &fit(const core::TimeSeries &ts);

	/// Scores the series with the configured strategy.
	DetectionSeries detectAnomalies(const core::TimeSeries &ts) const;

	/// detectAnomalies() plus the weekday baseline deviation of every scored observation.
	std::vector<ContextualAnomalyRecord> detectContextualAnomalies(const core::TimeSeries &ts) const;

	DetectionSeries detectChangePoints(const core::TimeSeries &ts) const;
	DetectionSeries detectSeasonalAnomalies(const core::TimeSeries &ts) const;
	DetectionSeries detectBurstPatterns(const core::TimeSeries &ts) const;

	/**
	 * @brief Runs anomaly, change-point, seasonal and burst scoring together.
	 *
	 * One record per observation scored by the anomaly strategy. The other three detectors run
	 * through the IDetector interface; an observation they did not score contributes 0.
	 */
	std::vector<CombinedDetectionRecord> combineDetectionMethods(const core::TimeSeries &ts) const;

	/// Fits (for model strategies) and scores in one step.
	DetectionSeries detect(const core::TimeSeries &ts) override;

	DetectionKind kind() const override {
		return DetectionKind::Anomaly;
	}

	std::string getName() const override {
		return "AnomalyDetector";
	}

	/// Token polled while training the isolation forest and the one-class SVM.
	void setCancellationToken(utils::CancellationToken token) {
		token_ = std::move(token);
	}

	bool isFitted() const {
		return fitted_;
	}

	const AnomalyDetectorConfig &config() const {
		return config_;
	}

private:
	DetectionSeries scoreModel(const core::TimeSeries &ts) const;
	std::vector<std::unique_ptr<IDetector>> companionDetectors() const;

	AnomalyDetectorConfig config_;
	utils::CancellationToken token_;
	bool fitted_ = false;

	std::vector<std::string> columns_;
	ColumnScaler scaler_;
	Eigen::MatrixXd training_;
	double offset_ = 0.0;
	std::unique_ptr<IsolationForest> forest_;
	std::unique_ptr<LocalOutlierFactor> lof_;
	std::unique_ptr<OneClassSVM> svm_;
};

} // namespace entitypulse::detectors
