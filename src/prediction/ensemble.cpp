#include "entity-pulse/prediction/ensemble.hpp"
#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/utils/logging.hpp"

#include <algorithm>
#include <map>

namespace entitypulse::prediction {

std::optional<double> ForecastResult::valueAt(const core::Date &date) const {
	const auto it = std::lower_bound(points.begin(), points.end(), date,
	                                 [](const ForecastPoint &point, const core::Date &d) { return point.date < d; });
	if (it == points.end() || it->date != date) {
		return std::nullopt;
	}
	return it->value;
}

ForecastResult combineEnsemble(const std::string &entity, const std::vector<ModelOutcome> &outcomes) {
	struct Accumulator {
		double sum = 0.0;
		std::size_t count = 0;
	};
	std::map<core::Date, Accumulator> by_date;
	std::size_t contributing = 0;
	for (const auto &outcome : outcomes) {
		if (!outcome.succeeded()) {
			continue;
		}
		++contributing;
		for (const auto &point : outcome.forecast->points) {
			auto &acc = by_date[point.date];
			acc.sum += point.value;
			++acc.count;
		}
	}

	ForecastResult ensemble;
	ensemble.entity = entity;
	ensemble.model = "ensemble";
	ensemble.points.reserve(by_date.size());
	for (const auto &entry : by_date) {
		ensemble.points.push_back(
		    ForecastPoint{entry.first, entry.second.sum / static_cast<double>(entry.second.count)});
	}
	ENTITYPULSE_DEBUG("Ensemble for '{}' combines {} of {} models over {} dates.", entity, contributing,
	                  outcomes.size(), ensemble.points.size());
	return ensemble;
}

std::vector<PredictedEvent> detectPredictedEvents(const ForecastResult &ensemble, double threshold,
                                                  std::size_t neighbour_window) {
	if (!(threshold > 0.0)) {
		throw core::InvalidParameter("Event threshold must be positive.");
	}
	if (neighbour_window == 0) {
		throw core::InvalidParameter("Event neighbour window must be at least 1.");
	}

	std::vector<PredictedEvent> events;
	const auto window = static_cast<std::int64_t>(neighbour_window);
	for (const auto &point : ensemble.points) {
		if (point.value < threshold) {
			continue;
		}
		bool peak = true;
		for (std::int64_t offset = 1; offset <= window && peak; ++offset) {
			for (const auto &neighbour : {point.date - offset, point.date + offset}) {
				const auto other = ensemble.valueAt(neighbour);
				if (other && *other >= point.value) {
					peak = false;
					break;
				}
			}
		}
		if (!peak) {
			continue;
		}
		events.push_back(PredictedEvent{ensemble.entity, point.date, point.value,
		                                std::min(1.0, point.value / (2.0 * threshold))});
	}
	return events;
}

} // namespace entitypulse::prediction
