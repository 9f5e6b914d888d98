#include "entity-pulse/detectors/detection.hpp"
#include "entity-pulse/core/errors.hpp"

#include <algorithm>

namespace entitypulse::detectors {

std::string toString(DetectionKind kind) {
	switch (kind) {
	case DetectionKind::Anomaly:
		return "anomaly";
	case DetectionKind::Burst:
		return "burst";
	case DetectionKind::ChangePoint:
		return "change_point";
	case DetectionKind::Seasonal:
		return "seasonal";
	}
	return "unknown";
}

std::string toString(DetectionMethod method) {
	switch (method) {
	case DetectionMethod::IsolationForest:
		return "isolation_forest";
	case DetectionMethod::LocalOutlierFactor:
		return "local_outlier_factor";
	case DetectionMethod::OneClassSVM:
		return "one_class_svm";
	case DetectionMethod::ZScore:
		return "z_score";
	case DetectionMethod::IQR:
		return "iqr";
	case DetectionMethod::MovingAverage:
		return "moving_average";
	case DetectionMethod::Seasonal:
		return "seasonal";
	case DetectionMethod::ChangePoint:
		return "change_point";
	case DetectionMethod::Burst:
		return "burst";
	}
	return "unknown";
}

DetectionMethod parseDetectionMethod(const std::string &name) {
	static const DetectionMethod all[] = {
	    DetectionMethod::IsolationForest, DetectionMethod::LocalOutlierFactor, DetectionMethod::OneClassSVM,
	    DetectionMethod::ZScore,          DetectionMethod::IQR,                DetectionMethod::MovingAverage,
	    DetectionMethod::Seasonal,        DetectionMethod::ChangePoint,        DetectionMethod::Burst};
	for (const auto method : all) {
		if (toString(method) == name) {
			return method;
		}
	}
	throw core::InvalidParameter("Unknown detection method: " + name);
}

DetectionKind kindOf(DetectionMethod method) {
	switch (method) {
	case DetectionMethod::Seasonal:
		return DetectionKind::Seasonal;
	case DetectionMethod::ChangePoint:
		return DetectionKind::ChangePoint;
	case DetectionMethod::Burst:
		return DetectionKind::Burst;
	default:
		return DetectionKind::Anomaly;
	}
}

std::size_t DetectionSeries::flaggedCount() const {
	return static_cast<std::size_t>(
	    std::count_if(records.begin(), records.end(), [](const AnomalyRecord &r) { return r.flagged; }));
}

std::vector<std::size_t> DetectionSeries::flaggedIndices() const {
	std::vector<std::size_t> indices;
	for (const auto &record : records) {
		if (record.flagged) {
			indices.push_back(record.index);
		}
	}
	return indices;
}

const AnomalyRecord *DetectionSeries::find(std::size_t index) const {
	const auto it = std::lower_bound(records.begin(), records.end(), index,
	                                 [](const AnomalyRecord &r, std::size_t i) { return r.index < i; });
	if (it == records.end() || it->index != index) {
		return nullptr;
	}
	return &*it;
}

} // namespace entitypulse::detectors
