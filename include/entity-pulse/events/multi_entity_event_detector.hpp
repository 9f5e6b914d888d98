#pragma once

#include "entity-pulse/correlation/correlation_analyzer.hpp"
#include "entity-pulse/data/time_series_provider.hpp"
#include "entity-pulse/detectors/burst_detector.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace entitypulse::events {

struct CorrelatedPair {
	std::string entity1;
	std::string entity2;
	double correlation = 0.0;
	double p_value = 1.0;
};

struct CorrelatedEventsReport {
	/// Entities with data in the range, sorted.
	std::vector<std::string> entities;
	core::DateRange range;
	double min_correlation = 0.0;
	correlation::CorrelationMatrix matrix;
	graph::EntityGraph network;
	std::vector<graph::Community> communities;
	/// Pairs with |correlation| >= min_correlation, whatever their p-value.
	std::vector<CorrelatedPair> correlated_pairs;
};

/**
 * @struct CoOccurringEvent
 * @brief Days on which several entities burst together.
 */
struct CoOccurringEvent {
	/// 1-based position in the report.
	std::size_t id = 0;
	core::Date start_date;
	core::Date end_date;
	std::vector<std::string> entities;
	std::vector<core::Date> dates;
	/// Number of shared burst days.
	std::size_t duration = 0;
	std::string description;
};

struct CoOccurringEventsReport {
	std::vector<std::string> entities;
	core::DateRange range;
	std::size_t max_days_gap = 0;
	std::vector<CoOccurringEvent> events;
};

struct CausalEventsReport {
	std::vector<std::string> entities;
	core::DateRange range;
	int max_lag = 0;
	double min_correlation = 0.0;
	std::vector<correlation::CausalRelationship> relationships;
	graph::EntityGraph network{true};
};

/**
 * @class MultiEntityEventDetector
 * @brief Correlation, co-occurring burst and lead/lag analysis over a set of entities.
 *
 * Each operation loads the entities afresh and is parameterised on its own; the analyzer and
 * burst configurations given at construction supply everything else. Entities unknown to the
 * store or without mentions in the range are left out. When none remain the operation returns
 * nullopt.
 */
class MultiEntityEventDetector {
public:
	MultiEntityEventDetector(std::shared_ptr<const data::TimeSeriesProvider> provider,
	                         correlation::CorrelationConfig correlation_config = {},
	                         detectors::BurstDetectorConfig burst_config = {},
	                         std::shared_ptr<utils::WorkerPool> pool = nullptr);

	std::optional<CorrelatedEventsReport> detectCorrelatedEvents(const std::vector<std::string> &entities,
	                                                             const core::DateRange &range = {},
	                                                             double min_correlation = 0.7) const;

	std::optional<CoOccurringEventsReport> detectCoOccurringEvents(const std::vector<std::string> &entities,
	                                                               const core::DateRange &range = {},
	                                                               std::size_t max_days_gap = 3) const;

	std::optional<CausalEventsReport> detectCausalEvents(const std::vector<std::string> &entities,
	                                                     const core::DateRange &range = {}, int max_lag = 7,
	                                                     double min_correlation = 0.5) const;

private:
	std::optional<data::SeriesBatch> loadSeries(const std::vector<std::string> &entities,
	                                            const core::DateRange &range) const;

	std::shared_ptr<const data::TimeSeriesProvider> provider_;
	correlation::CorrelationConfig correlation_config_;
	detectors::BurstDetectorConfig burst_config_;
	std::shared_ptr<utils::WorkerPool> pool_;
};

} // namespace entitypulse::events
