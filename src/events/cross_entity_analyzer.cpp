#include "entity-pulse/events/cross_entity_analyzer.hpp"
#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/utils/logging.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <utility>

namespace entitypulse::events {

namespace {

struct TrackedArticle {
	const data::ArticleRecord *record = nullptr;
	core::Date date;
	std::vector<std::string> entities;
};

using EntityPair = std::pair<std::string, std::string>;

// Counts ordered by frequency; equal counts keep key order.
template <typename Key>
std::vector<std::pair<Key, std::size_t>> ranked(const std::map<Key, std::size_t> &counts,
                                                std::size_t limit = std::numeric_limits<std::size_t>::max()) {
	std::vector<std::pair<Key, std::size_t>> result(counts.begin(), counts.end());
	std::stable_sort(result.begin(), result.end(),
	                 [](const auto &a, const auto &b) { return a.second > b.second; });
	if (result.size() > limit) {
		result.resize(limit);
	}
	return result;
}

// Pairs are only joined into "a-b" labels once ranked; entity names may contain '-'.
std::vector<RankedCount> labelled(const std::vector<std::pair<EntityPair, std::size_t>> &pairs) {
	std::vector<RankedCount> result;
	result.reserve(pairs.size());
	for (const auto &entry : pairs) {
		result.emplace_back(entry.first.first + "-" + entry.first.second, entry.second);
	}
	return result;
}

std::vector<std::string> tracked_mentions(const data::ArticleRecord &article, const std::vector<std::string> &entities) {
	std::vector<std::string> found;
	for (const auto &entity : article.entities) {
		if (std::find(entities.begin(), entities.end(), entity) != entities.end() &&
		    std::find(found.begin(), found.end(), entity) == found.end()) {
			found.push_back(entity);
		}
	}
	return found;
}

CrossEntityEvent summarise(const std::vector<const TrackedArticle *> &cluster) {
	CrossEntityEvent event;
	event.article_count = cluster.size();

	std::map<std::string, std::size_t> entity_counts;
	std::map<EntityPair, std::size_t> pair_counts;
	std::map<std::string, std::size_t> theme_counts;
	std::map<std::string, std::size_t> source_counts;
	for (const auto *article : cluster) {
		const auto &mentioned = article->entities;
		for (std::size_t i = 0; i < mentioned.size(); ++i) {
			++entity_counts[mentioned[i]];
			for (std::size_t j = i + 1; j < mentioned.size(); ++j) {
				++pair_counts[std::minmax(mentioned[i], mentioned[j])];
			}
		}
		if (!article->record->theme.empty()) {
			++theme_counts[article->record->theme];
		}
		if (!article->record->domain.empty()) {
			++source_counts[article->record->domain];
		}
	}
	event.entity_counts = ranked(entity_counts);
	event.entity_pairs = labelled(ranked(pair_counts, 5));
	event.themes = ranked(theme_counts, 3);
	event.sources = ranked(source_counts, 5);

	auto by_trust = cluster;
	std::stable_sort(by_trust.begin(), by_trust.end(), [](const TrackedArticle *a, const TrackedArticle *b) {
		return a->record->trust_score > b->record->trust_score;
	});
	for (std::size_t i = 0; i < by_trust.size() && i < 5; ++i) {
		const auto &record = *by_trust[i]->record;
		event.top_articles.push_back(ArticleSummary{record.id, record.title, record.url, by_trust[i]->date,
		                                            record.domain, record.trust_score, by_trust[i]->entities});
	}
	return event;
}

} // namespace

void CrossEntityConfig::validate() const {
	if (min_trust_score < 0.0 || min_trust_score > 1.0) {
		throw core::InvalidParameter("min_trust_score must lie in [0, 1].");
	}
	if (min_articles == 0) {
		throw core::InvalidParameter("min_articles must be at least 1.");
	}
}

CrossEntityAnalyzer::CrossEntityAnalyzer(std::shared_ptr<const data::IMentionStore> store, CrossEntityConfig config)
    : store_(std::move(store)), config_(config) {
	if (!store_) {
		throw core::InvalidParameter("CrossEntityAnalyzer requires a mention store.");
	}
	config_.validate();
}

std::vector<std::string> CrossEntityAnalyzer::knownEntities(const std::vector<std::string> &entities) const {
	std::vector<std::string> known;
	for (const auto &entity : entities) {
		if (store_->containsEntity(entity)) {
			known.push_back(entity);
		} else {
			ENTITYPULSE_WARN("Entity '{}' not found in the mention store.", entity);
		}
	}
	return known;
}

std::vector<CrossEntityEvent> CrossEntityAnalyzer::findCrossEntityEvents(const std::vector<std::string> &entities,
                                                                         const core::DateRange &range) const {
	std::vector<CrossEntityEvent> events;
	const auto known = knownEntities(entities);
	if (known.size() < 2) {
		return events;
	}

	const auto articles = store_->articlesMentioningAny(known, range);
	std::vector<TrackedArticle> tracked;
	for (const auto &article : articles) {
		if (article.trust_score < config_.min_trust_score) {
			continue;
		}
		auto mentioned = tracked_mentions(article, known);
		if (mentioned.size() >= 2) {
			tracked.push_back(TrackedArticle{&article, core::Date::fromTimePoint(article.seen_at), std::move(mentioned)});
		}
	}
	if (tracked.empty()) {
		ENTITYPULSE_WARN("No articles mention at least two of the {} entities.", known.size());
		return events;
	}
	ENTITYPULSE_DEBUG("{} articles mention at least two tracked entities.", tracked.size());

	std::map<core::Date, std::size_t> per_day;
	for (const auto &article : tracked) {
		++per_day[article.date];
	}

	const auto window = static_cast<std::int64_t>(config_.cluster_window_days);
	for (auto it = per_day.begin(); it != per_day.end(); ++it) {
		const std::size_t count = it->second;
		if (count < config_.min_articles) {
			continue;
		}
		if (it != per_day.begin() && count <= std::prev(it)->second) {
			continue;
		}
		const auto next = std::next(it);
		if (next != per_day.end() && count <= next->second) {
			continue;
		}

		const core::Date start = it->first - window;
		const core::Date end = it->first + window;
		std::vector<const TrackedArticle *> cluster;
		for (const auto &article : tracked) {
			if (article.date >= start && article.date <= end) {
				cluster.push_back(&article);
			}
		}
		if (cluster.size() < config_.min_articles) {
			continue;
		}
		auto event = summarise(cluster);
		event.start_date = start;
		event.end_date = end;
		event.peak_date = it->first;
		event.peak_count = count;
		events.push_back(std::move(event));
	}
	ENTITYPULSE_INFO("Identified {} cross-entity events among {} entities.", events.size(), known.size());
	return events;
}

CoOccurrenceMatrix CrossEntityAnalyzer::findEntityCoOccurrences(const std::vector<std::string> &entities,
                                                                const core::DateRange &range) const {
	CoOccurrenceMatrix matrix;
	const auto known = knownEntities(entities);
	for (const auto &entity : known) {
		matrix[entity];
	}
	for (const auto &article : store_->articlesMentioningAny(known, range)) {
		if (article.trust_score < config_.min_trust_score) {
			continue;
		}
		const auto mentioned = tracked_mentions(article, known);
		for (std::size_t i = 0; i < mentioned.size(); ++i) {
			for (std::size_t j = 0; j < mentioned.size(); ++j) {
				if (i != j) {
					++matrix[mentioned[i]][mentioned[j]];
				}
			}
		}
	}
	return matrix;
}

} // namespace entitypulse::events
