#include "entity-pulse/detectors/burst_detector.hpp"
#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/utils/logging.hpp"

#include <algorithm>
#include <future>
#include <set>

namespace entitypulse::detectors {

namespace {

BurstEvent open_event(const BurstScore &day) {
	BurstEvent event;
	event.start_index = event.end_index = event.peak_index = day.index;
	event.start_date = event.end_date = event.peak_date = day.date;
	event.peak_value = day.value;
	event.peak_score = day.score;
	return event;
}

void extend_event(BurstEvent &event, const BurstScore &day) {
	event.end_index = day.index;
	event.end_date = day.date;
	event.values.push_back(day.value);
	event.indices.push_back(day.index);
	if (day.date) {
		event.dates.push_back(*day.date);
	}
	if (day.value > event.peak_value) {
		event.peak_index = day.index;
		event.peak_date = day.date;
		event.peak_value = day.value;
		event.peak_score = day.score;
	}
}

// Plateaus report their middle sample.
std::vector<std::size_t> local_maxima(const std::vector<double> &x) {
	std::vector<std::size_t> peaks;
	const std::size_t n = x.size();
	if (n < 3) {
		return peaks;
	}
	std::size_t i = 1;
	while (i < n - 1) {
		if (x[i - 1] < x[i]) {
			std::size_t ahead = i + 1;
			while (ahead < n - 1 && x[ahead] == x[i]) {
				++ahead;
			}
			if (x[ahead] < x[i]) {
				peaks.push_back((i + ahead - 1) / 2);
				i = ahead;
				continue;
			}
		}
		++i;
	}
	return peaks;
}

} // namespace

void BurstDetectorConfig::validate() const {
	if (sensitivity <= 0.0) {
		throw core::InvalidParameter("Burst sensitivity must be positive.");
	}
	if (window_size == 0) {
		throw core::InvalidParameter("Burst window size must be at least 1.");
	}
	if (min_burst_duration == 0) {
		throw core::InvalidParameter("Minimum burst duration must be at least 1 day.");
	}
	if (task_budget.count() < 0) {
		throw core::InvalidParameter("Task budget must not be negative.");
	}
}

BurstDetector::BurstDetector(BurstDetectorConfig config, std::shared_ptr<utils::WorkerPool> pool)
    : config_(config), pool_(std::move(pool)) {
	config_.validate();
}

std::vector<BurstScore> BurstDetector::detectBursts(const core::TimeSeries &ts) const {
	auto scores = scoreBursts(ts, config_.window_size, config_.sensitivity);
	if (!ts.isEmpty() && ts.size() <= config_.window_size) {
		ENTITYPULSE_WARN("Series '{}' has {} observations; burst window {} needs more.", ts.entity(), ts.size(),
		                 config_.window_size);
	}
	return scores;
}

std::vector<BurstEvent> BurstDetector::detectBurstEvents(const core::TimeSeries &ts) const {
	const auto scores = detectBursts(ts);
	std::vector<BurstEvent> events;
	std::optional<BurstEvent> current;

	const auto close = [&]() {
		if (!current) {
			return;
		}
		current->duration = static_cast<std::size_t>(ts.distance(current->start_index, current->end_index)) + 1;
		if (current->duration >= config_.min_burst_duration) {
			events.push_back(std::move(*current));
		}
		current.reset();
	};

	for (const auto &day : scores) {
		if (!day.is_burst) {
			continue;
		}
		if (current && ts.distance(current->end_index, day.index) > static_cast<std::int64_t>(config_.max_burst_gap)) {
			close();
		}
		if (!current) {
			current = open_event(day);
		}
		extend_event(*current, day);
	}
	close();

	ENTITYPULSE_INFO("BurstDetector found {} burst events for '{}'.", events.size(), ts.entity());
	return events;
}

std::vector<Peak> BurstDetector::detectPeaks(const core::TimeSeries &ts, double prominence, double width) const {
	if (prominence < 0.0 || width < 0.0) {
		throw core::InvalidParameter("Peak prominence and width must not be negative.");
	}
	const auto &x = ts.getValues();
	std::vector<Peak> peaks;

	for (const std::size_t p : local_maxima(x)) {
		Peak peak;
		peak.index = p;
		peak.date = ts.maybeDateAt(p);
		peak.value = x[p];

		// Walk outwards until a higher sample; the lowest point on each side is its base.
		double left_min = x[p];
		peak.left_base = p;
		for (std::size_t i = p + 1; i-- > 0 && x[i] <= x[p];) {
			if (x[i] < left_min) {
				left_min = x[i];
				peak.left_base = i;
			}
		}
		double right_min = x[p];
		peak.right_base = p;
		for (std::size_t i = p; i < x.size() && x[i] <= x[p]; ++i) {
			if (x[i] < right_min) {
				right_min = x[i];
				peak.right_base = i;
			}
		}
		peak.prominence = x[p] - std::max(left_min, right_min);

		const double height = x[p] - 0.5 * peak.prominence;
		std::size_t i = p;
		while (peak.left_base < i && height < x[i]) {
			--i;
		}
		double left_ip = static_cast<double>(i);
		if (x[i] < height) {
			left_ip += (height - x[i]) / (x[i + 1] - x[i]);
		}
		i = p;
		while (i < peak.right_base && height < x[i]) {
			++i;
		}
		double right_ip = static_cast<double>(i);
		if (x[i] < height) {
			right_ip -= (height - x[i]) / (x[i - 1] - x[i]);
		}
		peak.width = right_ip - left_ip;

		if (peak.prominence >= prominence && peak.width >= width) {
			peaks.push_back(peak);
		}
	}

	std::stable_sort(peaks.begin(), peaks.end(),
	                 [](const Peak &a, const Peak &b) { return a.prominence > b.prominence; });
	ENTITYPULSE_DEBUG("detectPeaks found {} peaks for '{}'.", peaks.size(), ts.entity());
	return peaks;
}

MultiScaleBursts BurstDetector::detectMultiScaleBursts(const core::TimeSeries &ts,
                                                       const std::vector<std::size_t> &scales) const {
	if (scales.empty()) {
		throw core::InvalidParameter("At least one burst scale is required.");
	}
	MultiScaleBursts result;
	result.scales = scales;
	result.rows.resize(ts.size());
	for (std::size_t i = 0; i < ts.size(); ++i) {
		result.rows[i].index = i;
		result.rows[i].date = ts.maybeDateAt(i);
		result.rows[i].value = ts[i];
	}

	for (const std::size_t scale : scales) {
		if (scale == 0) {
			throw core::InvalidParameter("Burst scales must be at least 1.");
		}
		const auto scores = scoreBursts(ts, scale, config_.sensitivity);
		for (std::size_t i = 0; i < scores.size(); ++i) {
			auto &row = result.rows[i];
			row.scores.push_back(scores[i].score);
			row.flags.push_back(scores[i].is_burst);
			row.combined_score += scores[i].score / static_cast<double>(scales.size());
			row.is_combined_burst = row.is_combined_burst || scores[i].is_burst;
		}
	}
	return result;
}

std::vector<CrossEntityBurst>
BurstDetector::detectEntityCorrelationBursts(const std::map<std::string, core::TimeSeries> &series) const {
	for (const auto &entry : series) {
		if (!entry.second.isEmpty() && !entry.second.hasCalendar()) {
			throw core::InvalidParameter("Cross-entity bursts need calendar-indexed series: " + entry.first);
		}
	}

	std::vector<std::pair<std::string, std::future<std::vector<BurstEvent>>>> pending;
	pending.reserve(series.size());
	for (const auto &entry : series) {
		const core::TimeSeries *ts = &entry.second;
		pending.emplace_back(entry.first, utils::dispatch(
		                                      pool_,
		                                      [this, ts](const utils::CancellationToken &token) {
			                                      token.throwIfCancelled("detectBurstEvents");
			                                      return detectBurstEvents(*ts);
		                                      },
		                                      config_.task_budget));
	}

	utils::waitAll(pending);
	std::map<core::Date, std::set<std::string>> active;
	for (auto &job : pending) {
		for (const auto &event : job.second.get()) {
			for (const auto &date : event.dates) {
				active[date].insert(job.first);
			}
		}
	}

	std::vector<CrossEntityBurst> bursts;
	std::set<std::string> members;
	for (const auto &day : active) {
		if (day.second.size() < 2) {
			continue;
		}
		if (!bursts.empty() && day.first - bursts.back().end_date <= static_cast<std::int64_t>(config_.max_burst_gap)) {
			bursts.back().end_date = day.first;
			bursts.back().dates.push_back(day.first);
		} else {
			if (!bursts.empty()) {
				bursts.back().entities.assign(members.begin(), members.end());
				members.clear();
			}
			CrossEntityBurst burst;
			burst.start_date = burst.end_date = day.first;
			burst.dates.push_back(day.first);
			bursts.push_back(std::move(burst));
		}
		members.insert(day.second.begin(), day.second.end());
	}
	if (!bursts.empty()) {
		bursts.back().entities.assign(members.begin(), members.end());
	}

	ENTITYPULSE_INFO("Found {} cross-entity bursts across {} entities.", bursts.size(), series.size());
	return bursts;
}

} // namespace entitypulse::detectors
