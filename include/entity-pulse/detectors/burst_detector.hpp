#pragma once

#include "entity-pulse/detectors/scoring.hpp"
#include "entity-pulse/utils/worker_pool.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace entitypulse::detectors {

struct BurstDetectorConfig {
	/// Burst score a day must exceed to be flagged.
	double sensitivity = 2.0;
	/// Number of previous days forming the baseline.
	std::size_t window_size = 3;
	/// Minimum span in days of a reported burst event.
	std::size_t min_burst_duration = 1;
	/// Largest distance in days between flagged days of the same event.
	std::size_t max_burst_gap = 1;
	/// Per-entity time budget in cross-entity detection; zero disables it.
	std::chrono::milliseconds task_budget{0};

	void validate() const;
};

/**
 * @struct BurstEvent
 * @brief A run of flagged days merged into one burst.
 */
struct BurstEvent {
	std::size_t start_index = 0;
	std::size_t end_index = 0;
	std::size_t peak_index = 0;
	std::optional<core::Date> start_date;
	std::optional<core::Date> end_date;
	std::optional<core::Date> peak_date;
	double peak_value = 0.0;
	double peak_score = 0.0;
	/// Inclusive span from start to end in days (positions for series without a calendar).
	std::size_t duration = 0;
	/// Values of the flagged days, in order.
	std::vector<double> values;
	std::vector<std::size_t> indices;
	/// Flagged calendar days; empty for series without a calendar.
	std::vector<core::Date> dates;
};

/**
 * @struct Peak
 * @brief A local maximum with its topographic prominence and width at half prominence.
 */
struct Peak {
	std::size_t index = 0;
	std::optional<core::Date> date;
	double value = 0.0;
	double prominence = 0.0;
	double width = 0.0;
	std::size_t left_base = 0;
	std::size_t right_base = 0;
};

struct MultiScaleBurstScore {
	std::size_t index = 0;
	std::optional<core::Date> date;
	double value = 0.0;
	/// Score and flag per scale, in the order of MultiScaleBursts::scales.
	std::vector<double> scores;
	std::vector<bool> flags;
	double combined_score = 0.0;
	bool is_combined_burst = false;
};

struct MultiScaleBursts {
	std::vector<std::size_t> scales;
	std::vector<MultiScaleBurstScore> rows;
};

/**
 * @struct CrossEntityBurst
 * @brief Days on which at least two entities burst at once, merged across small gaps.
 */
struct CrossEntityBurst {
	core::Date start_date;
	core::Date end_date;
	/// Participating entities, sorted.
	std::vector<std::string> entities;
	std::vector<core::Date> dates;
};

/**
 * @class BurstDetector
 * @brief Finds short upward deviations of mention volume against a trailing baseline.
 *
 * A day is a burst when (value - mean) / (std + eps) over the previous window exceeds the
 * sensitivity and the value is not below that mean; a decrease is never a burst.
 */
class BurstDetector {
public:
	explicit BurstDetector(BurstDetectorConfig config = {}, std::shared_ptr<utils::WorkerPool> pool = nullptr);

	std::vector<BurstScore> detectBursts(const core::TimeSeries &ts) const;

	/**
	 * @brief Groups flagged days into events.
	 *
	 * A flagged day joins the open event when it lies at most max_burst_gap days after the
	 * event's last flagged day; otherwise the open event is closed and kept only when its
	 * duration reaches min_burst_duration. The peak is the first day holding the largest value.
	 */
	std::vector<BurstEvent> detectBurstEvents(const core::TimeSeries &ts) const;

	/**
	 * @brief Local maxima with prominence and width (at half prominence) at least the given minimums.
	 * @return Peaks sorted by prominence, largest first.
	 */
	std::vector<Peak> detectPeaks(const core::TimeSeries &ts, double prominence = 1.0, double width = 1.0) const;

	/// Burst scoring repeated at several window sizes; combined score is the mean, the flag the OR.
	MultiScaleBursts detectMultiScaleBursts(const core::TimeSeries &ts,
	                                        const std::vector<std::size_t> &scales = {3, 7, 14, 30}) const;

	/**
	 * @brief Calendar days on which two or more entities have a burst in progress.
	 *
	 * Burst events are detected per entity (on the worker pool when one was given). Such days
	 * closer than max_burst_gap are merged into one record listing every participating entity.
	 *
	 * @throws core::InvalidParameter if a series has no calendar.
	 */
	std::vector<CrossEntityBurst>
	detectEntityCorrelationBursts(const std::map<std::string, core::TimeSeries> &series) const;

	const BurstDetectorConfig &config() const {
		return config_;
	}

private:
	BurstDetectorConfig config_;
	std::shared_ptr<utils::WorkerPool> pool_;
};

} // namespace entitypulse::detectors
