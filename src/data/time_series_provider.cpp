#include "entity-pulse/data/time_series_provider.hpp"
#include "entity-pulse/utils/logging.hpp"

#include <algorithm>

namespace entitypulse::data {

TimeSeriesProvider::TimeSeriesProvider(std::shared_ptr<const IMentionStore> store, ProviderOptions options)
    : store_(std::move(store)), options_(options) {
	if (!store_) {
		throw core::InvalidParameter("TimeSeriesProvider requires a mention store.");
	}
}

core::TimeSeries TimeSeriesProvider::load(const std::string &entity, const core::DateRange &range) const {
	if (range.start && range.end && *range.end < *range.start) {
		throw core::InvalidParameter("Date range end precedes its start.");
	}
	if (!store_->containsEntity(entity)) {
		throw core::EntityNotFound(entity);
	}

	const auto articles = store_->articlesMentioning(entity, range);
	if (articles.empty()) {
		ENTITYPULSE_DEBUG("No mentions of '{}' in the requested range.", entity);
		return core::TimeSeries(std::vector<core::Date>{}, std::vector<double>{}, entity);
	}

	std::map<core::Date, double> daily;
	for (const auto &article : articles) {
		daily[core::Date::fromTimePoint(article.seen_at)] += 1.0;
	}

	core::Date first = daily.begin()->first;
	core::Date last = daily.rbegin()->first;
	if (options_.fill_requested_range) {
		if (range.start) {
			first = std::min(first, *range.start);
		}
		if (range.end) {
			last = std::max(last, *range.end);
		}
	}

	const auto span = static_cast<std::size_t>(last - first + 1);
	std::vector<core::Date> dates;
	std::vector<double> values;
	dates.reserve(span);
	values.reserve(span);
	for (core::Date day = first; day <= last; day += 1) {
		dates.push_back(day);
		const auto it = daily.find(day);
		values.push_back(it == daily.end() ? 0.0 : it->second);
	}

	ENTITYPULSE_DEBUG("Loaded {} days ({} mentions) for '{}'.", dates.size(), articles.size(), entity);
	return core::TimeSeries(std::move(dates), std::move(values), entity);
}

SeriesBatch TimeSeriesProvider::loadMany(const std::vector<std::string> &entities,
                                         const core::DateRange &range) const {
	SeriesBatch batch;
	for (const auto &entity : entities) {
		try {
			auto series = load(entity, range);
			if (!series.isEmpty()) {
				batch.series.emplace(entity, std::move(series));
			}
		} catch (const core::EntityNotFound &e) {
			ENTITYPULSE_WARN("Skipping entity: {}", e.what());
			batch.missing.push_back(entity);
		}
	}
	return batch;
}

} // namespace entitypulse::data
