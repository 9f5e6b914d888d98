#pragma once

#include "entity-pulse/core/date.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace entitypulse::data {

/**
 * @struct ArticleRecord
 * @brief One stored article together with the entities extracted from it.
 */
struct ArticleRecord {
	using TimePoint = std::chrono::system_clock::time_point;

	std::int64_t id = 0;
	std::string title;
	std::string url;
	/// Publishing source (domain).
	std::string domain;
	std::string theme;
	double trust_score = 0.0;
	TimePoint seen_at{};
	std::vector<std::string> entities;

	bool mentions(const std::string &entity) const {
		return std::find(entities.begin(), entities.end(), entity) != entities.end();
	}
};

/**
 * @class IMentionStore
 * @brief Read-only access to stored articles and their entity mentions.
 *
 * The persistence layer implements this interface; the analysis code never writes through it.
 */
class IMentionStore {
public:
	virtual ~IMentionStore() = default;

	/**
	 * @brief Whether the entity has at least one stored mention, regardless of date.
	 */
	virtual bool containsEntity(const std::string &entity) const = 0;

	/**
	 * @brief Articles mentioning @p entity whose calendar day lies inside @p range.
	 * @return Articles ordered by seen_at.
	 */
	virtual std::vector<ArticleRecord> articlesMentioning(const std::string &entity,
	                                                      const core::DateRange &range) const = 0;

	/**
	 * @brief Articles mentioning at least one of @p entities inside @p range, ordered by seen_at.
	 */
	virtual std::vector<ArticleRecord> articlesMentioningAny(const std::vector<std::string> &entities,
	                                                         const core::DateRange &range) const = 0;
};

} // namespace entitypulse::data
