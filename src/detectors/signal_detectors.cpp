#include "entity-pulse/detectors/signal_detectors.hpp"
#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/detectors/scoring.hpp"
#include "entity-pulse/utils/logging.hpp"

namespace entitypulse::detectors {

BurstSignalDetector::BurstSignalDetector(std::size_t window, double sensitivity)
    : window_(window), sensitivity_(sensitivity) {
	if (window_ == 0) {
		throw core::InvalidParameter("Burst window must be at least 1.");
	}
	if (sensitivity_ <= 0.0) {
		throw core::InvalidParameter("Burst sensitivity must be positive.");
	}
}

DetectionSeries BurstSignalDetector::detect(const core::TimeSeries &ts) {
	return toDetectionSeries(scoreBursts(ts, window_, sensitivity_));
}

ChangePointDetector::ChangePointDetector(std::size_t window, double threshold)
    : window_(window), threshold_(threshold) {
	if (window_ == 0) {
		throw core::InvalidParameter("Change point window must be at least 1.");
	}
	if (threshold_ <= 0.0) {
		throw core::InvalidParameter("Change point threshold must be positive.");
	}
}

DetectionSeries ChangePointDetector::detect(const core::TimeSeries &ts) {
	auto series = scoreChangePoints(ts, window_, threshold_);
	ENTITYPULSE_DEBUG("ChangePointDetector found {} change points.", series.flaggedCount());
	return series;
}

SeasonalDetector::SeasonalDetector(std::size_t period, double threshold) : period_(period), threshold_(threshold) {
	if (period_ < 2) {
		throw core::InvalidParameter("Seasonal period must be at least 2.");
	}
	if (threshold_ <= 0.0) {
		throw core::InvalidParameter("Seasonal threshold must be positive.");
	}
}

DetectionSeries SeasonalDetector::detect(const core::TimeSeries &ts) {
	auto series = scoreSeasonal(ts, period_, threshold_);
	ENTITYPULSE_DEBUG("SeasonalDetector found {} seasonal anomalies.", series.flaggedCount());
	return series;
}

} // namespace entitypulse::detectors
