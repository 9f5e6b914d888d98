#pragma once

#include "entity-pulse/data/mention_store.hpp"

#include <unordered_set>

namespace entitypulse::data {

/**
 * @class InMemoryMentionStore
 * @brief IMentionStore over an in-process article list.
 *
 * Articles are added before analysis starts; afterwards the store is only read, so concurrent
 * queries from worker threads need no locking.
 */
class InMemoryMentionStore final : public IMentionStore {
public:
	InMemoryMentionStore() = default;
	explicit InMemoryMentionStore(std::vector<ArticleRecord> articles);

	void addArticle(ArticleRecord article);

	std::size_t size() const {
		return articles_.size();
	}

	bool containsEntity(const std::string &entity) const override;
	std::vector<ArticleRecord> articlesMentioning(const std::string &entity,
	                                              const core::DateRange &range) const override;
	std::vector<ArticleRecord> articlesMentioningAny(const std::vector<std::string> &entities,
	                                                 const core::DateRange &range) const override;

private:
	std::vector<ArticleRecord> articles_;
	std::unordered_set<std::string> known_entities_;
};

} // namespace entitypulse::data
