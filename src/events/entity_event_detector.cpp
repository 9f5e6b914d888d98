#include "entity-pulse/events/entity_event_detector.hpp"
#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/utils/logging.hpp"

#include <algorithm>
#include <future>
#include <utility>

namespace entitypulse::events {

namespace {

using detectors::DetectionKind;

struct OpenGroup {
	CombinedEvent event;
	std::map<DetectionKind, double> best;
};

OpenGroup open_group(const std::string &entity, const RawEvent &raw) {
	OpenGroup group;
	group.event.entity = entity;
	group.event.date = raw.date;
	group.event.value = raw.value;
	group.event.description = raw.description;
	group.event.peak_score = raw.score;
	group.event.start_date = raw.start_date;
	group.event.end_date = raw.end_date;
	return group;
}

CombinedEvent close_group(OpenGroup group) {
	double sum = 0.0;
	for (const auto &entry : group.best) {
		group.event.methods.insert(entry.first);
		sum += entry.second;
	}
	group.event.score = group.best.empty() ? 0.0 : sum / static_cast<double>(group.best.size());
	return std::move(group.event);
}

void absorb(OpenGroup &group, const RawEvent &raw) {
	auto &event = group.event;
	const auto found = group.best.find(raw.type);
	if (found == group.best.end()) {
		group.best.emplace(raw.type, raw.score);
	} else {
		found->second = std::max(found->second, raw.score);
	}
	if (raw.score > event.peak_score) {
		event.peak_score = raw.score;
		event.date = raw.date;
		event.value = raw.value;
		event.description = raw.description;
	}
	event.start_date = std::min(event.start_date, raw.start_date);
	event.end_date = std::max(event.end_date, raw.end_date);
	++event.raw_count;
}

} // namespace

void EntityEventConfig::validate() const {
	anomaly.validate();
	burst.validate();
	if (methods.empty()) {
		throw core::InvalidParameter("At least one event detection method is required.");
	}
	if (methods.count(DetectionKind::Seasonal) > 0) {
		throw core::InvalidParameter("Seasonal detections are not merged into entity events.");
	}
	if (task_budget.count() < 0) {
		throw core::InvalidParameter("Task budget must not be negative.");
	}
}

std::vector<CombinedEvent> mergeRawEvents(const std::string &entity, std::vector<RawEvent> raw,
                                          std::size_t max_days_gap) {
	std::vector<CombinedEvent> merged;
	if (raw.empty()) {
		return merged;
	}
	std::stable_sort(raw.begin(), raw.end(), [](const RawEvent &a, const RawEvent &b) { return a.date < b.date; });

	const auto gap = static_cast<std::int64_t>(max_days_gap);
	OpenGroup group = open_group(entity, raw.front());
	absorb(group, raw.front());
	for (std::size_t i = 1; i < raw.size(); ++i) {
		if (raw[i].date - group.event.date <= gap) {
			absorb(group, raw[i]);
			continue;
		}
		merged.push_back(close_group(std::move(group)));
		group = open_group(entity, raw[i]);
		absorb(group, raw[i]);
	}
	merged.push_back(close_group(std::move(group)));
	return merged;
}

EntityEventDetector::EntityEventDetector(std::shared_ptr<const data::TimeSeriesProvider> provider,
                                         EntityEventConfig config, std::shared_ptr<utils::WorkerPool> pool)
    : provider_(std::move(provider)), config_(std::move(config)), pool_(std::move(pool)) {
	if (!provider_) {
		throw core::InvalidParameter("EntityEventDetector requires a time series provider.");
	}
	config_.validate();
}

std::vector<RawEvent> EntityEventDetector::anomalyEvents(const core::TimeSeries &ts,
                                                         const utils::CancellationToken &token) const {
	detectors::AnomalyDetector detector(config_.anomaly);
	detector.setCancellationToken(token);
	detector.fit(ts);

	std::vector<RawEvent> events;
	for (const auto &record : detector.detectContextualAnomalies(ts)) {
		if (!record.combined_flag) {
			continue;
		}
		RawEvent event;
		event.type = DetectionKind::Anomaly;
		event.date = event.start_date = event.end_date = ts.dateAt(record.anomaly.index);
		event.value = record.anomaly.value;
		event.score = record.combined_score;
		event.description = "Anomalous mention count for " + ts.entity();
		events.push_back(std::move(event));
	}
	return events;
}

std::vector<RawEvent> EntityEventDetector::burstEvents(const core::TimeSeries &ts) const {
	const detectors::BurstDetector detector(config_.burst);
	std::vector<RawEvent> events;
	for (const auto &burst : detector.detectBurstEvents(ts)) {
		RawEvent event;
		event.type = DetectionKind::Burst;
		event.date = ts.dateAt(burst.peak_index);
		event.start_date = ts.dateAt(burst.start_index);
		event.end_date = ts.dateAt(burst.end_index);
		event.value = burst.peak_value;
		event.score = burst.peak_score;
		event.duration = burst.duration;
		event.description =
		    fmt::format("Burst in mentions for {} (duration: {} days)", ts.entity(), burst.duration);
		events.push_back(std::move(event));
	}
	return events;
}

std::vector<RawEvent> EntityEventDetector::changePointEvents(const core::TimeSeries &ts) const {
	const detectors::AnomalyDetector detector(config_.anomaly);
	std::vector<RawEvent> events;
	for (const auto &record : detector.detectChangePoints(ts).records) {
		if (!record.flagged) {
			continue;
		}
		RawEvent event;
		event.type = DetectionKind::ChangePoint;
		event.date = event.start_date = event.end_date = ts.dateAt(record.index);
		event.value = record.value;
		event.score = record.score;
		event.description = "Change point in mention pattern for " + ts.entity();
		events.push_back(std::move(event));
	}
	return events;
}

EntityEventReport EntityEventDetector::analyzeSeries(const core::TimeSeries &ts,
                                                     const utils::CancellationToken &token) const {
	if (!ts.isEmpty() && !ts.hasCalendar()) {
		throw core::InvalidParameter("Entity event detection needs a calendar-indexed series.");
	}
	EntityEventReport report;
	report.entity = ts.entity();
	if (ts.isEmpty()) {
		return report;
	}
	report.start_date = ts.getDates().front();
	report.end_date = ts.getDates().back();
	report.total_mentions = ts.total();
	report.avg_daily_mentions = ts.mean();
	report.max_daily_mentions = ts.maxValue();

	const auto wants = [this](DetectionKind kind) { return config_.methods.count(kind) > 0; };
	if (wants(DetectionKind::Anomaly)) {
		report.anomalies = anomalyEvents(ts, token);
	}
	token.throwIfCancelled("detectEntityEvents");
	if (wants(DetectionKind::Burst)) {
		report.bursts = burstEvents(ts);
	}
	if (wants(DetectionKind::ChangePoint)) {
		report.change_points = changePointEvents(ts);
	}

	std::vector<RawEvent> raw;
	raw.reserve(report.anomalies.size() + report.bursts.size() + report.change_points.size());
	raw.insert(raw.end(), report.anomalies.begin(), report.anomalies.end());
	raw.insert(raw.end(), report.bursts.begin(), report.bursts.end());
	raw.insert(raw.end(), report.change_points.begin(), report.change_points.end());
	report.events = mergeRawEvents(ts.entity(), std::move(raw), config_.max_days_gap);

	ENTITYPULSE_INFO("'{}': {} anomalies, {} bursts, {} change points merged into {} events.", ts.entity(),
	                 report.anomalies.size(), report.bursts.size(), report.change_points.size(),
	                 report.events.size());
	return report;
}

std::optional<EntityEventReport> EntityEventDetector::detectEntityEvents(const std::string &entity,
                                                                         const core::DateRange &range) const {
	const auto ts = provider_->load(entity, range);
	if (ts.isEmpty()) {
		ENTITYPULSE_WARN("No mentions of '{}' in the requested range.", entity);
		return std::nullopt;
	}
	return analyzeSeries(ts);
}

EntityEventBatch EntityEventDetector::detectEventsForEntities(const std::vector<std::string> &entities,
                                                              const core::DateRange &range) const {
	std::vector<std::pair<std::string, std::future<std::optional<EntityEventReport>>>> pending;
	pending.reserve(entities.size());
	for (const auto &entity : entities) {
		pending.emplace_back(entity, utils::dispatch(
		                                 pool_,
		                                 [this, entity, range](const utils::CancellationToken &token) {
			                                 const auto ts = provider_->load(entity, range);
			                                 if (ts.isEmpty()) {
				                                 return std::optional<EntityEventReport>();
			                                 }
			                                 return std::optional<EntityEventReport>(analyzeSeries(ts, token));
		                                 },
		                                 config_.task_budget));
	}

	utils::waitAll(pending);
	EntityEventBatch batch;
	for (auto &job : pending) {
		try {
			auto report = job.second.get();
			if (report) {
				batch.reports.emplace(job.first, std::move(*report));
			} else {
				batch.empty.push_back(job.first);
			}
		} catch (const std::exception &e) {
			ENTITYPULSE_WARN("Event detection for '{}' failed: {}", job.first, e.what());
			batch.failures.push_back(EntityEventFailure{job.first, e.what()});
		}
	}
	ENTITYPULSE_INFO("Event detection finished for {} entities ({} empty, {} failed).", entities.size(),
	                 batch.empty.size(), batch.failures.size());
	return batch;
}

} // namespace entitypulse::events
