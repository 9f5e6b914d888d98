#pragma once

#include "entity-pulse/data/mention_store.hpp"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace entitypulse::events {

struct CrossEntityConfig {
	/// Articles below this trust score are ignored.
	double min_trust_score = 0.5;
	/// Smallest article count of a peak day and of the cluster around it.
	std::size_t min_articles = 2;
	/// Days on either side of a peak that belong to its cluster.
	std::size_t cluster_window_days = 3;

	void validate() const;
};

/// A name with the number of articles it occurs in, used for the ranked lists of an event.
using RankedCount = std::pair<std::string, std::size_t>;

struct ArticleSummary {
	std::int64_t id = 0;
	std::string title;
	std::string url;
	core::Date date;
	std::string source;
	double trust_score = 0.0;
	/// Entities of the analysed set the article mentions.
	std::vector<std::string> entities;
};

/**
 * @struct CrossEntityEvent
 * @brief A cluster of articles that mention several tracked entities around a peak day.
 */
struct CrossEntityEvent {
	core::Date start_date;
	core::Date end_date;
	core::Date peak_date;
	std::size_t article_count = 0;
	std::size_t peak_count = 0;
	/// Articles per entity, most mentioned first.
	std::vector<RankedCount> entity_counts;
	/// Up to five "a-b" pairs (names sorted within the pair), most frequent first.
	std::vector<RankedCount> entity_pairs;
	std::vector<RankedCount> themes;
	std::vector<RankedCount> sources;
	/// Up to five articles with the highest trust score.
	std::vector<ArticleSummary> top_articles;
};

/// Symmetric co-mention counts; only pairs mentioned together at least once are present.
using CoOccurrenceMatrix = std::map<std::string, std::map<std::string, std::size_t>>;

/**
 * @class CrossEntityAnalyzer
 * @brief Article-level analysis of stories that involve several entities at once.
 */
class CrossEntityAnalyzer {
public:
	explicit CrossEntityAnalyzer(std::shared_ptr<const data::IMentionStore> store, CrossEntityConfig config = {});

	/**
	 * @brief Finds peaks of articles that mention at least two of @p entities.
	 *
	 * Articles are counted per day; a day whose count is strictly greater than both neighbouring
	 * observed days and at least min_articles is a peak. Every peak yields one event over the
	 * articles within cluster_window_days of it. Events are ordered by peak date.
	 */
	std::vector<CrossEntityEvent> findCrossEntityEvents(const std::vector<std::string> &entities,
	                                                    const core::DateRange &range = {}) const;

	/// Number of trusted articles mentioning each pair of @p entities.
	CoOccurrenceMatrix findEntityCoOccurrences(const std::vector<std::string> &entities,
	                                           const core::DateRange &range = {}) const;

	const CrossEntityConfig &config() const {
		return config_;
	}

private:
	std::vector<std::string> knownEntities(const std::vector<std::string> &entities) const;

	std::shared_ptr<const data::IMentionStore> store_;
	CrossEntityConfig config_;
};

} // namespace entitypulse::events
