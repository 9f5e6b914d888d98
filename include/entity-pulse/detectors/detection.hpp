#pragma once

#include "entity-pulse/core/time_series.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace entitypulse::detectors {

/// Family a detection belongs to.
enum class DetectionKind { Anomaly, Burst, ChangePoint, Seasonal };

/// Concrete scoring method that produced a record.
enum class DetectionMethod {
	IsolationForest,
	LocalOutlierFactor,
	OneClassSVM,
	ZScore,
	IQR,
	MovingAverage,
	Seasonal,
	ChangePoint,
	Burst
};

std::string toString(DetectionKind kind);
std::string toString(DetectionMethod method);
DetectionMethod parseDetectionMethod(const std::string &name);
DetectionKind kindOf(DetectionMethod method);

/**
 * @struct AnomalyRecord
 * @brief Score and flag of one observation under one method.
 *
 * Scores are oriented so that larger means more unusual.
 */
struct AnomalyRecord {
	std::size_t index = 0;
	std::optional<core::Date> date;
	double value = 0.0;
	double score = 0.0;
	bool flagged = false;
	DetectionMethod method = DetectionMethod::ZScore;
};

/**
 * @struct DetectionSeries
 * @brief The records a detector produced for one series, ordered by index.
 */
struct DetectionSeries {
	DetectionKind kind = DetectionKind::Anomaly;
	DetectionMethod method = DetectionMethod::ZScore;
	std::vector<AnomalyRecord> records;

	std::size_t flaggedCount() const;
	std::vector<std::size_t> flaggedIndices() const;
	/// Record for a series index, or nullptr when that index produced none.
	const AnomalyRecord *find(std::size_t index) const;
	bool empty() const {
		return records.empty();
	}
};

/**
 * @class IDetector
 * @brief Common interface of every per-series detector.
 *
 * detect() scores the given series from scratch; detectors that learn a model fit it on the
 * same series first.
 */
class IDetector {
public:
	virtual ~IDetector() = default;

	virtual DetectionSeries detect(const core::TimeSeries &ts) = 0;
	virtual DetectionKind kind() const = 0;
	virtual std::string getName() const = 0;
};

} // namespace entitypulse::detectors
