#include "entity-pulse/detectors/scoring.hpp"
#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/stats/descriptive.hpp"
#include "entity-pulse/stats/rolling.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace entitypulse::detectors {

namespace {

DetectionSeries make_series(const core::TimeSeries &ts, DetectionMethod method) {
	DetectionSeries series;
	series.kind = kindOf(method);
	series.method = method;
	series.records.reserve(ts.size());
	for (std::size_t i = 0; i < ts.size(); ++i) {
		AnomalyRecord record;
		record.index = i;
		record.date = ts.maybeDateAt(i);
		record.value = ts[i];
		record.method = method;
		series.records.push_back(record);
	}
	return series;
}

double scaled_deviation(double value, double mean, double stdev) {
	const double diff = std::abs(value - mean);
	return diff == 0.0 ? 0.0 : diff / (stdev + kScoreEpsilon);
}

long long season_key(const core::TimeSeries &ts, std::size_t index, std::size_t period) {
	if (ts.hasCalendar()) {
		if (period == 7) {
			return ts.weekdayAt(index);
		}
		const long long days = ts.dateAt(index).daysSinceEpoch();
		const long long p = static_cast<long long>(period);
		return ((days % p) + p) % p;
	}
	return static_cast<long long>(index % period);
}

} // namespace

std::vector<BurstScore> scoreBursts(const core::TimeSeries &ts, std::size_t window, double sensitivity) {
	if (window == 0) {
		throw core::InvalidParameter("Burst window must be at least 1.");
	}
	const auto &values = ts.getValues();
	std::vector<BurstScore> scores(values.size());
	for (std::size_t i = 0; i < values.size(); ++i) {
		scores[i].index = i;
		scores[i].date = ts.maybeDateAt(i);
		scores[i].value = values[i];
		scores[i].rolling_mean = values[i];
	}
	if (values.size() <= window) {
		return scores;
	}

	const auto baseline = stats::trailingBaseline(values, window);
	const auto deviations = stats::deviationScores(values, baseline, kScoreEpsilon);
	for (std::size_t i = 0; i < values.size(); ++i) {
		auto &score = scores[i];
		score.rolling_mean = baseline.mean[i];
		score.rolling_std = baseline.stdev[i];
		score.score = deviations[i];
		score.is_burst = score.score > sensitivity && score.value >= score.rolling_mean;
	}
	return scores;
}

DetectionSeries toDetectionSeries(const std::vector<BurstScore> &scores) {
	DetectionSeries series;
	series.kind = DetectionKind::Burst;
	series.method = DetectionMethod::Burst;
	series.records.reserve(scores.size());
	for (const auto &score : scores) {
		series.records.push_back({score.index, score.date, score.value, score.score, score.is_burst,
		                          DetectionMethod::Burst});
	}
	return series;
}

DetectionSeries scoreZScore(const core::TimeSeries &ts, double threshold) {
	auto series = make_series(ts, DetectionMethod::ZScore);
	const auto &values = ts.getValues();
	const std::size_t n = values.size();
	if (n < 3) {
		return series;
	}

	double sum = 0.0;
	double sum_sq = 0.0;
	for (double v : values) {
		sum += v;
		sum_sq += v * v;
	}
	for (std::size_t i = 0; i < n; ++i) {
		const double others = static_cast<double>(n - 1);
		const double mean = (sum - values[i]) / others;
		const double ss = (sum_sq - values[i] * values[i]) - others * mean * mean;
		const double stdev = std::sqrt(std::max(0.0, ss) / (others - 1.0));
		auto &record = series.records[i];
		record.score = scaled_deviation(values[i], mean, stdev);
		record.flagged = record.score > threshold;
	}
	return series;
}

DetectionSeries scoreIQR(const core::TimeSeries &ts, double multiplier) {
	auto series = make_series(ts, DetectionMethod::IQR);
	const auto &values = ts.getValues();
	if (values.size() < 2) {
		return series;
	}
	const double q1 = stats::quantile(values, 0.25);
	const double q3 = stats::quantile(values, 0.75);
	const double iqr = q3 - q1;
	const double lower = q1 - multiplier * iqr;
	const double upper = q3 + multiplier * iqr;

	for (auto &record : series.records) {
		if (record.value > upper) {
			record.score = (record.value - upper) / (iqr + kScoreEpsilon);
		} else if (record.value < lower) {
			record.score = (lower - record.value) / (iqr + kScoreEpsilon);
		}
		record.flagged = record.value > upper || record.value < lower;
	}
	return series;
}

DetectionSeries scoreMovingAverage(const core::TimeSeries &ts, std::size_t window, double threshold) {
	auto series = make_series(ts, DetectionMethod::MovingAverage);
	if (ts.isEmpty()) {
		return series;
	}
	const std::size_t effective = std::max<std::size_t>(1, std::min(window, ts.size()));
	const auto baseline = stats::trailingBaseline(ts.getValues(), effective);
	for (auto &record : series.records) {
		record.score = scaled_deviation(record.value, baseline.mean[record.index], baseline.stdev[record.index]);
		record.flagged = record.score > threshold;
	}
	return series;
}

DetectionSeries scoreChangePoints(const core::TimeSeries &ts, std::size_t window, double threshold) {
	if (window == 0) {
		throw core::InvalidParameter("Change point window must be at least 1.");
	}
	auto series = make_series(ts, DetectionMethod::ChangePoint);
	const auto &values = ts.getValues();
	const std::size_t n = values.size();
	if (n <= 2 * window) {
		return series;
	}

	for (std::size_t i = window; i < n - window; ++i) {
		double mean_before = 0.0;
		double std_before = 0.0;
		double mean_after = 0.0;
		double std_after = 0.0;
		stats::windowMoments(values, i - window, i, mean_before, std_before);
		stats::windowMoments(values, i, i + window, mean_after, std_after);

		const double shift = std::abs(mean_after - mean_before);
		double score = shift;
		if (std_before > 0.0 && std_after > 0.0) {
			score = shift / std::sqrt(std_before * std_before + std_after * std_after);
		}
		series.records[i].score = score;
		series.records[i].flagged = score > threshold;
	}
	return series;
}

DetectionSeries scoreSeasonal(const core::TimeSeries &ts, std::size_t period, double threshold) {
	if (period < 2) {
		throw core::InvalidParameter("Seasonal period must be at least 2.");
	}
	auto series = make_series(ts, DetectionMethod::Seasonal);
	const std::size_t n = ts.size();
	if (n <= 2 * period) {
		return series;
	}

	std::map<long long, std::vector<double>> groups;
	for (std::size_t i = 0; i < n; ++i) {
		groups[season_key(ts, i, period)].push_back(ts[i]);
	}
	std::map<long long, std::pair<double, double>> moments;
	for (const auto &entry : groups) {
		moments[entry.first] = {stats::mean(entry.second), stats::stddev(entry.second, 1)};
	}

	for (auto &record : series.records) {
		const auto &m = moments[season_key(ts, record.index, period)];
		record.score = scaled_deviation(record.value, m.first, m.second);
		record.flagged = record.score > threshold;
	}
	return series;
}

} // namespace entitypulse::detectors
