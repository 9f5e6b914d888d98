#pragma once

#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/core/time_series.hpp"
#include "entity-pulse/data/mention_store.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace entitypulse::data {

struct ProviderOptions {
	/// Pad with zero days out to explicitly requested bounds instead of the observed span.
	bool fill_requested_range = false;
};

/// Series for several entities, keyed by entity name.
struct SeriesBatch {
	std::map<std::string, core::TimeSeries> series;
	/// Entities that are unknown to the store.
	std::vector<std::string> missing;

	bool empty() const {
		return series.empty();
	}
};

/**
 * @class TimeSeriesProvider
 * @brief Turns stored mentions into contiguous, zero-filled daily count series.
 *
 * Every call builds a fresh snapshot from the store; the provider keeps no state between calls,
 * so loading the same entity and range twice gives identical series.
 */
class TimeSeriesProvider {
public:
	explicit TimeSeriesProvider(std::shared_ptr<const IMentionStore> store, ProviderOptions options = {});

	/**
	 * @brief Loads the daily mention counts of one entity.
	 * @param entity Entity identifier.
	 * @param range Optional inclusive date bounds.
	 * @return A calendar-indexed series labelled with @p entity; empty if the range holds no mentions.
	 * @throws core::EntityNotFound if the entity has no stored mentions at all.
	 */
	core::TimeSeries load(const std::string &entity, const core::DateRange &range = {}) const;

	/**
	 * @brief Loads several entities, skipping empty series and recording unknown entities.
	 */
	SeriesBatch loadMany(const std::vector<std::string> &entities, const core::DateRange &range = {}) const;

	const IMentionStore &store() const {
		return *store_;
	}

	const std::shared_ptr<const IMentionStore> &storeHandle() const {
		return store_;
	}

private:
	std::shared_ptr<const IMentionStore> store_;
	ProviderOptions options_;
};

} // namespace entitypulse::data
