#include "entity-pulse/events/multi_entity_event_detector.hpp"
#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/utils/logging.hpp"

#include <cmath>
#include <utility>

namespace entitypulse::events {

namespace {

std::vector<std::string> names_of(const data::SeriesBatch &batch) {
	std::vector<std::string> names;
	names.reserve(batch.series.size());
	for (const auto &entry : batch.series) {
		names.push_back(entry.first);
	}
	return names;
}

} // namespace

MultiEntityEventDetector::MultiEntityEventDetector(std::shared_ptr<const data::TimeSeriesProvider> provider,
                                                   correlation::CorrelationConfig correlation_config,
                                                   detectors::BurstDetectorConfig burst_config,
                                                   std::shared_ptr<utils::WorkerPool> pool)
    : provider_(std::move(provider)), correlation_config_(correlation_config), burst_config_(burst_config),
      pool_(std::move(pool)) {
	if (!provider_) {
		throw core::InvalidParameter("MultiEntityEventDetector requires a time series provider.");
	}
	correlation_config_.validate();
	burst_config_.validate();
}

std::optional<data::SeriesBatch> MultiEntityEventDetector::loadSeries(const std::vector<std::string> &entities,
                                                                      const core::DateRange &range) const {
	auto batch = provider_->loadMany(entities, range);
	if (batch.empty()) {
		ENTITYPULSE_WARN("No data available for any of {} entities.", entities.size());
		return std::nullopt;
	}
	return batch;
}

std::optional<CorrelatedEventsReport>
MultiEntityEventDetector::detectCorrelatedEvents(const std::vector<std::string> &entities,
                                                 const core::DateRange &range, double min_correlation) const {
	ENTITYPULSE_INFO("Detecting correlated events for {} entities.", entities.size());
	auto config = correlation_config_;
	config.min_correlation = min_correlation;
	const correlation::CorrelationAnalyzer analyzer(config, pool_);

	const auto batch = loadSeries(entities, range);
	if (!batch) {
		return std::nullopt;
	}

	CorrelatedEventsReport report;
	report.entities = names_of(*batch);
	report.range = range;
	report.min_correlation = min_correlation;
	report.matrix = analyzer.calculateEntityCorrelations(batch->series);
	report.network = analyzer.createCorrelationNetwork(batch->series);
	report.communities = graph::greedyModularityCommunities(report.network);

	const auto &names = report.matrix.entities;
	for (Eigen::Index i = 0; i < report.matrix.coefficients.rows(); ++i) {
		for (Eigen::Index j = i + 1; j < report.matrix.coefficients.cols(); ++j) {
			const double r = report.matrix.coefficients(i, j);
			if (std::abs(r) < min_correlation) {
				continue;
			}
			report.correlated_pairs.push_back(CorrelatedPair{names[static_cast<std::size_t>(i)],
			                                                 names[static_cast<std::size_t>(j)], r,
			                                                 report.matrix.p_values(i, j)});
		}
	}
	ENTITYPULSE_INFO("{} correlated pairs, {} communities.", report.correlated_pairs.size(),
	                 report.communities.size());
	return report;
}

std::optional<CoOccurringEventsReport>
MultiEntityEventDetector::detectCoOccurringEvents(const std::vector<std::string> &entities,
                                                  const core::DateRange &range, std::size_t max_days_gap) const {
	ENTITYPULSE_INFO("Detecting co-occurring events for {} entities.", entities.size());
	auto config = burst_config_;
	config.max_burst_gap = max_days_gap;
	const detectors::BurstDetector detector(config, pool_);

	const auto batch = loadSeries(entities, range);
	if (!batch) {
		return std::nullopt;
	}

	CoOccurringEventsReport report;
	report.entities = names_of(*batch);
	report.range = range;
	report.max_days_gap = max_days_gap;
	for (auto &burst : detector.detectEntityCorrelationBursts(batch->series)) {
		CoOccurringEvent event;
		event.id = report.events.size() + 1;
		event.start_date = burst.start_date;
		event.end_date = burst.end_date;
		event.duration = burst.dates.size();
		event.description = fmt::format("Co-occurring burst involving {} entities", burst.entities.size());
		event.entities = std::move(burst.entities);
		event.dates = std::move(burst.dates);
		report.events.push_back(std::move(event));
	}
	ENTITYPULSE_INFO("Found {} co-occurring events.", report.events.size());
	return report;
}

std::optional<CausalEventsReport> MultiEntityEventDetector::detectCausalEvents(const std::vector<std::string> &entities,
                                                                               const core::DateRange &range,
                                                                               int max_lag,
                                                                               double min_correlation) const {
	ENTITYPULSE_INFO("Detecting causal events for {} entities.", entities.size());
	auto config = correlation_config_;
	config.max_lag = max_lag;
	config.min_correlation = min_correlation;
	const correlation::CorrelationAnalyzer analyzer(config, pool_);

	const auto batch = loadSeries(entities, range);
	if (!batch) {
		return std::nullopt;
	}

	CausalEventsReport report;
	report.entities = names_of(*batch);
	report.range = range;
	report.max_lag = max_lag;
	report.min_correlation = min_correlation;
	report.network = analyzer.createLaggedCorrelationNetwork(batch->series);
	report.relationships = analyzer.findCausalRelationships(batch->series);
	return report;
}

} // namespace entitypulse::events
