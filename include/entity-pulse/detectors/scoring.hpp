#pragma once

#include "entity-pulse/detectors/detection.hpp"

#include <vector>

namespace entitypulse::detectors {

constexpr double kScoreEpsilon = 1e-10;

/**
 * @struct BurstScore
 * @brief Burst statistics of one observation against its trailing baseline.
 */
struct BurstScore {
	std::size_t index = 0;
	std::optional<core::Date> date;
	double value = 0.0;
	double rolling_mean = 0.0;
	double rolling_std = 0.0;
	double score = 0.0;
	bool is_burst = false;
};

/**
 * @brief Scores every observation against the mean/std of the @p window values before it.
 *
 * score = (value - mean) / (std + eps); an observation is a burst only when score exceeds
 * @p sensitivity and value >= mean. Series not longer than the window score 0 everywhere.
 */
std::vector<BurstScore> scoreBursts(const core::TimeSeries &ts, std::size_t window, double sensitivity);

/// Leave-one-out z-score: each point against the mean and sample std of all other points.
DetectionSeries scoreZScore(const core::TimeSeries &ts, double threshold);

/// Distance beyond the Tukey fences [Q1 - k*IQR, Q3 + k*IQR] in units of IQR.
DetectionSeries scoreIQR(const core::TimeSeries &ts, double multiplier);

/// |value - trailing mean| / (trailing std + eps) over a window of previous days.
DetectionSeries scoreMovingAverage(const core::TimeSeries &ts, std::size_t window, double threshold);

/**
 * @brief Mean shift between the two adjacent windows [i - w, i) and [i, i + w).
 *
 * Only indices in [w, n - w) are scored and only when n > 2w; every other index scores 0.
 */
DetectionSeries scoreChangePoints(const core::TimeSeries &ts, std::size_t window, double threshold);

/**
 * @brief Deviation from the mean/std of the same weekday (or index modulo period without calendar).
 *
 * Requires n > 2 * period; shorter series score 0 everywhere.
 */
DetectionSeries scoreSeasonal(const core::TimeSeries &ts, std::size_t period, double threshold);

/// Burst scores wrapped as a DetectionSeries.
DetectionSeries toDetectionSeries(const std::vector<BurstScore> &scores);

} // namespace entitypulse::detectors
