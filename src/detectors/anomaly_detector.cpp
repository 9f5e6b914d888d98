#include "entity-pulse/detectors/anomaly_detector.hpp"
#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/detectors/scoring.hpp"
#include "entity-pulse/detectors/signal_detectors.hpp"
#include "entity-pulse/stats/descriptive.hpp"
#include "entity-pulse/utils/logging.hpp"

#include <array>
#include <cmath>
#include <map>

namespace entitypulse::detectors {

namespace {

std::vector<double> to_vector(const Eigen::VectorXd &v) {
	return std::vector<double>(v.data(), v.data() + v.size());
}

} // namespace

std::string toString(AnomalyStrategy strategy) {
	return toString(methodOf(strategy));
}

AnomalyStrategy parseAnomalyStrategy(const std::string &name) {
	static const std::array<AnomalyStrategy, 6> all = {
	    AnomalyStrategy::IsolationForest, AnomalyStrategy::LocalOutlierFactor, AnomalyStrategy::OneClassSVM,
	    AnomalyStrategy::ZScore,          AnomalyStrategy::IQR,                AnomalyStrategy::MovingAverage};
	for (const auto strategy : all) {
		if (toString(strategy) == name) {
			return strategy;
		}
	}
	throw core::InvalidParameter("Unknown anomaly strategy: " + name);
}

DetectionMethod methodOf(AnomalyStrategy strategy) {
	switch (strategy) {
	case AnomalyStrategy::IsolationForest:
		return DetectionMethod::IsolationForest;
	case AnomalyStrategy::LocalOutlierFactor:
		return DetectionMethod::LocalOutlierFactor;
	case AnomalyStrategy::OneClassSVM:
		return DetectionMethod::OneClassSVM;
	case AnomalyStrategy::ZScore:
		return DetectionMethod::ZScore;
	case AnomalyStrategy::IQR:
		return DetectionMethod::IQR;
	case AnomalyStrategy::MovingAverage:
		return DetectionMethod::MovingAverage;
	}
	throw core::InvalidParameter("Unknown anomaly strategy.");
}

bool isModelBased(AnomalyStrategy strategy) {
	return strategy == AnomalyStrategy::IsolationForest || strategy == AnomalyStrategy::LocalOutlierFactor ||
	       strategy == AnomalyStrategy::OneClassSVM;
}

void AnomalyDetectorConfig::validate() const {
	if (contamination <= 0.0 || contamination > 0.5) {
		throw core::InvalidParameter("Contamination must lie in (0, 0.5].");
	}
	if (z_threshold <= 0.0 || iqr_multiplier <= 0.0 || moving_average_threshold <= 0.0 ||
	    contextual_threshold <= 0.0 || change_point_threshold <= 0.0 || seasonal_threshold <= 0.0 ||
	    burst_threshold <= 0.0) {
		throw core::InvalidParameter("Anomaly detector thresholds must be positive.");
	}
	if (moving_average_window == 0 || change_point_window == 0 || burst_window == 0) {
		throw core::InvalidParameter("Anomaly detector windows must be at least 1.");
	}
	if (seasonal_period < 2) {
		throw core::InvalidParameter("Seasonal period must be at least 2.");
	}
	if (n_estimators == 0 || n_neighbors == 0) {
		throw core::InvalidParameter("Model sizes (n_estimators, n_neighbors) must be positive.");
	}
}

AnomalyDetector::AnomalyDetector(AnomalyDetectorConfig config) : config_(config) {
	config_.validate();
}

AnomalyDetector &AnomalyDetector::fit(const core::TimeSeries &ts) {
	forest_.reset();
	lof_.reset();
	svm_.reset();
	columns_.clear();
	training_.resize(0, 0);
	offset_ = 0.0;
	fitted_ = true;

	if (!isModelBased(config_.strategy)) {
		return *this;
	}

	const auto features = buildAnomalyFeatures(ts);
	if (features.empty()) {
		ENTITYPULSE_WARN("Empty feature matrix for '{}' ({} observations); no {} model trained.", ts.entity(),
		                 ts.size(), toString(config_.strategy));
		return *this;
	}
	columns_ = features.columns;

	const double boundary_quantile = 1.0 - config_.contamination;
	switch (config_.strategy) {
	case AnomalyStrategy::IsolationForest: {
		IsolationForest::Options options;
		options.n_estimators = config_.n_estimators;
		options.seed = config_.seed;
		forest_ = std::make_unique<IsolationForest>(options);
		forest_->fit(features.values, token_);
		offset_ = stats::quantile(to_vector(forest_->anomalyScores(features.values)), boundary_quantile);
		training_ = features.values;
		break;
	}
	case AnomalyStrategy::LocalOutlierFactor: {
		scaler_ = ColumnScaler::fit(features.values);
		training_ = scaler_.transform(features.values);
		lof_ = std::make_unique<LocalOutlierFactor>(config_.n_neighbors);
		lof_->fit(training_);
		offset_ = stats::quantile(to_vector(lof_->trainingScores()), boundary_quantile);
		break;
	}
	case AnomalyStrategy::OneClassSVM: {
		scaler_ = ColumnScaler::fit(features.values);
		training_ = scaler_.transform(features.values);
		OneClassSVM::Options options;
		options.nu = config_.contamination;
		options.gamma = 1.0 / static_cast<double>(training_.cols());
		svm_ = std::make_unique<OneClassSVM>(options);
		svm_->fit(training_, token_);
		break;
	}
	default:
		break;
	}
	ENTITYPULSE_DEBUG("AnomalyDetector trained {} on {} rows x {} features (offset {:.6f}).",
	                  toString(config_.strategy), features.rows(), columns_.size(), offset_);
	return *this;
}

DetectionSeries AnomalyDetector::scoreModel(const core::TimeSeries &ts) const {
	DetectionSeries series;
	series.kind = DetectionKind::Anomaly;
	series.method = methodOf(config_.strategy);

	const auto features = buildAnomalyFeatures(ts);
	if (features.empty()) {
		ENTITYPULSE_WARN("Empty feature matrix for '{}'; nothing to score.", ts.entity());
		return series;
	}
	if (!fitted_) {
		throw std::runtime_error("AnomalyDetector::detectAnomalies called before fit.");
	}
	if (!forest_ && !lof_ && !svm_) {
		throw std::runtime_error("AnomalyDetector has no trained model; fit it on a longer series.");
	}
	if (features.columns != columns_) {
		throw core::InvalidParameter("Feature columns differ from those seen during fit.");
	}

	Eigen::VectorXd scores;
	if (forest_) {
		scores = (forest_->anomalyScores(features.values).array() - offset_).matrix();
	} else if (lof_) {
		const Eigen::MatrixXd scaled = scaler_.transform(features.values);
		const bool same_rows = scaled.rows() == training_.rows() && scaled.isApprox(training_);
		const Eigen::VectorXd lof = same_rows ? lof_->trainingScores() : lof_->score(scaled);
		scores = (lof.array() - offset_).matrix();
	} else {
		scores = -svm_->decisionFunction(scaler_.transform(features.values));
	}

	series.records.reserve(features.rows());
	for (std::size_t r = 0; r < features.rows(); ++r) {
		const std::size_t index = features.row_index[r];
		AnomalyRecord record;
		record.index = index;
		record.date = ts.maybeDateAt(index);
		record.value = ts[index];
		record.score = scores(static_cast<Eigen::Index>(r));
		record.flagged = record.score > 0.0;
		record.method = series.method;
		series.records.push_back(record);
	}
	return series;
}

DetectionSeries AnomalyDetector::detectAnomalies(const core::TimeSeries &ts) const {
	DetectionSeries series;
	switch (config_.strategy) {
	case AnomalyStrategy::ZScore:
		series = scoreZScore(ts, config_.z_threshold);
		break;
	case AnomalyStrategy::IQR:
		series = scoreIQR(ts, config_.iqr_multiplier);
		break;
	case AnomalyStrategy::MovingAverage:
		series = scoreMovingAverage(ts, config_.moving_average_window, config_.moving_average_threshold);
		break;
	default:
		series = scoreModel(ts);
		break;
	}
	ENTITYPULSE_INFO("AnomalyDetector ({}) flagged {} of {} observations for '{}'.", toString(config_.strategy),
	                 series.flaggedCount(), series.records.size(), ts.entity());
	return series;
}

std::vector<ContextualAnomalyRecord> AnomalyDetector::detectContextualAnomalies(const core::TimeSeries &ts) const {
	const auto anomalies = detectAnomalies(ts);
	std::vector<ContextualAnomalyRecord> result;
	if (anomalies.empty()) {
		return result;
	}

	std::map<int, std::vector<double>> by_weekday;
	for (const auto &record : anomalies.records) {
		by_weekday[ts.weekdayAt(record.index)].push_back(record.value);
	}
	std::map<int, std::pair<double, double>> baseline;
	for (const auto &entry : by_weekday) {
		baseline[entry.first] = {stats::mean(entry.second), stats::stddev(entry.second, 1)};
	}

	result.reserve(anomalies.records.size());
	for (const auto &record : anomalies.records) {
		ContextualAnomalyRecord contextual;
		contextual.anomaly = record;
		contextual.day_of_week = ts.weekdayAt(record.index);
		const auto &moments = baseline[contextual.day_of_week];
		const double diff = std::abs(record.value - moments.first);
		contextual.contextual_score = diff == 0.0 ? 0.0 : diff / (moments.second + kScoreEpsilon);
		contextual.contextual_flag = contextual.contextual_score > config_.contextual_threshold;
		contextual.combined_score = (record.score + contextual.contextual_score) / 2.0;
		contextual.combined_flag = record.flagged || contextual.contextual_flag;
		result.push_back(contextual);
	}
	return result;
}

DetectionSeries AnomalyDetector::detectChangePoints(const core::TimeSeries &ts) const {
	return ChangePointDetector(config_.change_point_window, config_.change_point_threshold).detect(ts);
}

DetectionSeries AnomalyDetector::detectSeasonalAnomalies(const core::TimeSeries &ts) const {
	return SeasonalDetector(config_.seasonal_period, config_.seasonal_threshold).detect(ts);
}

DetectionSeries AnomalyDetector::detectBurstPatterns(const core::TimeSeries &ts) const {
	return BurstSignalDetector(config_.burst_window, config_.burst_threshold).detect(ts);
}

std::vector<std::unique_ptr<IDetector>> AnomalyDetector::companionDetectors() const {
	std::vector<std::unique_ptr<IDetector>> detectors;
	detectors.push_back(
	    std::make_unique<ChangePointDetector>(config_.change_point_window, config_.change_point_threshold));
	detectors.push_back(std::make_unique<SeasonalDetector>(config_.seasonal_period, config_.seasonal_threshold));
	detectors.push_back(std::make_unique<BurstSignalDetector>(config_.burst_window, config_.burst_threshold));
	return detectors;
}

std::vector<CombinedDetectionRecord> AnomalyDetector::combineDetectionMethods(const core::TimeSeries &ts) const {
	const auto anomalies = detectAnomalies(ts);

	std::map<DetectionKind, DetectionSeries> companions;
	for (const auto &detector : companionDetectors()) {
		companions[detector->kind()] = detector->detect(ts);
	}
	const auto lookup = [&](DetectionKind kind, std::size_t index) -> const AnomalyRecord * {
		const auto it = companions.find(kind);
		return it == companions.end() ? nullptr : it->second.find(index);
	};

	std::vector<CombinedDetectionRecord> combined;
	combined.reserve(anomalies.records.size());
	for (const auto &record : anomalies.records) {
		CombinedDetectionRecord row;
		row.index = record.index;
		row.date = record.date;
		row.value = record.value;
		row.anomaly_score = record.score;
		row.anomaly_flag = record.flagged;
		if (const auto *cp = lookup(DetectionKind::ChangePoint, record.index)) {
			row.change_point_score = cp->score;
			row.change_point_flag = cp->flagged;
		}
		if (const auto *seasonal = lookup(DetectionKind::Seasonal, record.index)) {
			row.seasonal_score = seasonal->score;
			row.seasonal_flag = seasonal->flagged;
		}
		if (const auto *burst = lookup(DetectionKind::Burst, record.index)) {
			row.burst_score = burst->score;
			row.burst_flag = burst->flagged;
		}
		row.combined_score = (row.anomaly_score + row.change_point_score + row.seasonal_score + row.burst_score) / 4.0;
		row.is_event = row.anomaly_flag || row.change_point_flag || row.seasonal_flag || row.burst_flag;
		combined.push_back(row);
	}
	return combined;
}

DetectionSeries AnomalyDetector::detect(const core::TimeSeries &ts) {
	fit(ts);
	return detectAnomalies(ts);
}

} // namespace entitypulse::detectors
