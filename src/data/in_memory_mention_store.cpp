#include "entity-pulse/data/in_memory_mention_store.hpp"

#include <algorithm>

namespace entitypulse::data {

InMemoryMentionStore::InMemoryMentionStore(std::vector<ArticleRecord> articles) {
	articles_.reserve(articles.size());
	for (auto &article : articles) {
		addArticle(std::move(article));
	}
}

void InMemoryMentionStore::addArticle(ArticleRecord article) {
	for (const auto &entity : article.entities) {
		known_entities_.insert(entity);
	}
	const auto pos = std::upper_bound(articles_.begin(), articles_.end(), article.seen_at,
	                                  [](const auto &tp, const ArticleRecord &rec) { return tp < rec.seen_at; });
	articles_.insert(pos, std::move(article));
}

bool InMemoryMentionStore::containsEntity(const std::string &entity) const {
	return known_entities_.count(entity) > 0;
}

std::vector<ArticleRecord> InMemoryMentionStore::articlesMentioning(const std::string &entity,
                                                                    const core::DateRange &range) const {
	std::vector<ArticleRecord> result;
	for (const auto &article : articles_) {
		if (range.contains(core::Date::fromTimePoint(article.seen_at)) && article.mentions(entity)) {
			result.push_back(article);
		}
	}
	return result;
}

std::vector<ArticleRecord> InMemoryMentionStore::articlesMentioningAny(const std::vector<std::string> &entities,
                                                                       const core::DateRange &range) const {
	std::vector<ArticleRecord> result;
	for (const auto &article : articles_) {
		if (!range.contains(core::Date::fromTimePoint(article.seen_at))) {
			continue;
		}
		const bool any = std::any_of(entities.begin(), entities.end(),
		                             [&](const std::string &entity) { return article.mentions(entity); });
		if (any) {
			result.push_back(article);
		}
	}
	return result;
}

} // namespace entitypulse::data
