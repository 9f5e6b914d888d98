#pragma once

#include "entity-pulse/data/time_series_provider.hpp"
#include "entity-pulse/detectors/anomaly_detector.hpp"
#include "entity-pulse/detectors/burst_detector.hpp"
#include "entity-pulse/utils/worker_pool.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace entitypulse::events {

struct EntityEventConfig {
	detectors::AnomalyDetectorConfig anomaly;
	detectors::BurstDetectorConfig burst;
	/// Largest distance in days from an open event's representative date that still merges.
	std::size_t max_days_gap = 3;
	/// Raw detections to collect; any of Anomaly, Burst and ChangePoint.
	std::set<detectors::DetectionKind> methods{detectors::DetectionKind::Anomaly, detectors::DetectionKind::Burst,
	                                           detectors::DetectionKind::ChangePoint};
	/// Per-entity time budget in batch detection; zero disables it.
	std::chrono::milliseconds task_budget{0};

	void validate() const;
};

/**
 * @struct RawEvent
 * @brief One dated detection of a single method before merging.
 */
struct RawEvent {
	core::Date date;
	detectors::DetectionKind type = detectors::DetectionKind::Anomaly;
	double value = 0.0;
	double score = 0.0;
	std::string description;
	/// Span of the detection; burst events cover several days.
	core::Date start_date;
	core::Date end_date;
	std::size_t duration = 1;
};

/**
 * @struct CombinedEvent
 * @brief Raw detections of one entity that fall close together, merged into a single event.
 */
struct CombinedEvent {
	std::string entity;
	/// Date, value and description of the highest-scoring raw detection.
	core::Date date;
	double value = 0.0;
	std::string description;
	std::set<detectors::DetectionKind> methods;
	/// Mean over the contributing methods of each method's best score.
	double score = 0.0;
	double peak_score = 0.0;
	core::Date start_date;
	core::Date end_date;
	std::size_t raw_count = 0;
};

struct EntityEventReport {
	std::string entity;
	core::Date start_date;
	core::Date end_date;
	double total_mentions = 0.0;
	double avg_daily_mentions = 0.0;
	double max_daily_mentions = 0.0;
	std::vector<RawEvent> anomalies;
	std::vector<RawEvent> bursts;
	std::vector<RawEvent> change_points;
	std::vector<CombinedEvent> events;
};

struct EntityEventFailure {
	std::string entity;
	std::string message;
};

struct EntityEventBatch {
	/// Reports of the entities with data, keyed by entity.
	std::map<std::string, EntityEventReport> reports;
	/// Entities whose range held no mentions.
	std::vector<std::string> empty;
	std::vector<EntityEventFailure> failures;
};

/**
 * @brief Merges raw detections into combined events.
 *
 * Detections are visited in date order. A detection joins the open event when it lies at most
 * @p max_days_gap days after the event's representative date; a detection with a strictly higher
 * score becomes the new representative.
 */
std::vector<CombinedEvent> mergeRawEvents(const std::string &entity, std::vector<RawEvent> raw,
                                          std::size_t max_days_gap);

/**
 * @class EntityEventDetector
 * @brief Runs anomaly, burst and change-point detection for one entity and merges the results.
 */
class EntityEventDetector {
public:
	EntityEventDetector(std::shared_ptr<const data::TimeSeriesProvider> provider, EntityEventConfig config = {},
	                    std::shared_ptr<utils::WorkerPool> pool = nullptr);

	/**
	 * @brief Detects and merges the events of one entity.
	 * @return nullopt when the range holds no mentions.
	 * @throws core::EntityNotFound if the entity has no stored mentions at all.
	 */
	std::optional<EntityEventReport> detectEntityEvents(const std::string &entity,
	                                                    const core::DateRange &range = {}) const;

	/// detectEntityEvents() for every entity; per-entity errors are recorded, not thrown.
	EntityEventBatch detectEventsForEntities(const std::vector<std::string> &entities,
	                                         const core::DateRange &range = {}) const;

	/// Raw detections of an already loaded series, grouped by method.
	EntityEventReport analyzeSeries(const core::TimeSeries &ts,
	                                const utils::CancellationToken &token = utils::CancellationToken()) const;

	const EntityEventConfig &config() const {
		return config_;
	}

private:
	std::vector<RawEvent> anomalyEvents(const core::TimeSeries &ts, const utils::CancellationToken &token) const;
	std::vector<RawEvent> burstEvents(const core::TimeSeries &ts) const;
	std::vector<RawEvent> changePointEvents(const core::TimeSeries &ts) const;

	std::shared_ptr<const data::TimeSeriesProvider> provider_;
	EntityEventConfig config_;
	std::shared_ptr<utils::WorkerPool> pool_;
};

} // namespace entitypulse::events
