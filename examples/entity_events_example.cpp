#include "entity-pulse/data/in_memory_mention_store.hpp"
#include "entity-pulse/data/time_series_provider.hpp"
#include "entity-pulse/events/cross_entity_analyzer.hpp"
#include "entity-pulse/events/entity_event_detector.hpp"
#include "entity-pulse/events/multi_entity_event_detector.hpp"
#include "entity-pulse/prediction/predictor.hpp"
#include "entity-pulse/utils/logging.hpp"
#include "entity-pulse/utils/worker_pool.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

using namespace entitypulse;

namespace {

const core::Date kStart = core::Date::fromYMD(2024, 3, 4);

// Ninety days of coverage for three companies; "Northwind" and "Contoso" share a merger story
// around day 45, and "Fabrikam" follows "Northwind" two days later.
std::shared_ptr<data::InMemoryMentionStore> synthesizeNewsroom() {
	std::mt19937 rng(11);
	std::poisson_distribution<int> base(4.0);
	std::bernoulli_distribution trusted(0.85);

	auto store = std::make_shared<data::InMemoryMentionStore>();
	std::int64_t next_id = 1;
	const auto publish = [&](int day, std::vector<std::string> entities, const std::string &theme,
	                         const std::string &domain) {
		data::ArticleRecord article;
		article.id = next_id++;
		article.title = entities.front() + " coverage #" + std::to_string(article.id);
		article.url = "https://" + domain + "/article/" + std::to_string(article.id);
		article.domain = domain;
		article.theme = theme;
		article.trust_score = trusted(rng) ? 0.9 : 0.3;
		article.seen_at = (kStart + day).toTimePoint();
		article.entities = std::move(entities);
		store->addArticle(std::move(article));
	};

	std::vector<int> northwind(90);
	for (int day = 0; day < 90; ++day) {
		const int weekday_boost = (kStart + day).dayOfWeek() < 5 ? 2 : 0;
		northwind[static_cast<std::size_t>(day)] = base(rng) + weekday_boost + (day >= 44 && day <= 47 ? 15 : 0);
	}
	for (int day = 0; day < 90; ++day) {
		for (int i = 0; i < northwind[static_cast<std::size_t>(day)]; ++i) {
			publish(day, {"Northwind"}, "business", "daily-ledger.example");
		}
		for (int i = 0, n = base(rng); i < n; ++i) {
			publish(day, {"Contoso"}, "business", "market-wire.example");
		}
		const int lagged = day >= 2 ? northwind[static_cast<std::size_t>(day - 2)] / 2 : 1;
		for (int i = 0; i < lagged; ++i) {
			publish(day, {"Fabrikam"}, "technology", "tech-herald.example");
		}
	}
	for (int day = 43; day <= 48; ++day) {
		const int joint = day == 45 ? 9 : 3;
		for (int i = 0; i < joint; ++i) {
			publish(day, {"Northwind", "Contoso"}, i % 2 == 0 ? "mergers" : "business",
			        i % 3 == 0 ? "market-wire.example" : "daily-ledger.example");
		}
	}
	return store;
}

void printEntityReport(const events::EntityEventReport &report) {
	std::cout << report.entity << ": " << report.start_date << " .. " << report.end_date << ", "
	          << report.total_mentions << " mentions (" << std::fixed << std::setprecision(1)
	          << report.avg_daily_mentions << "/day, max " << report.max_daily_mentions << ")\n";
	std::cout << "  raw detections: " << report.anomalies.size() << " anomalies, " << report.bursts.size()
	          << " bursts, " << report.change_points.size() << " change points\n";
	for (const auto &event : report.events) {
		std::cout << "  " << event.date << " score " << std::setprecision(2) << event.score << " via";
		for (const auto kind : event.methods) {
			std::cout << ' ' << detectors::toString(kind);
		}
		std::cout << " - " << event.description << '\n';
	}
	std::cout.unsetf(std::ios::floatfield);
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::warn);

	const auto store = synthesizeNewsroom();
	const auto provider = std::make_shared<data::TimeSeriesProvider>(store);
	const auto pool = std::make_shared<utils::WorkerPool>();
	const std::vector<std::string> entities{"Northwind", "Contoso", "Fabrikam"};

	std::cout << "=== Per-entity events ===\n";
	const events::EntityEventDetector detector(provider, {}, pool);
	const auto batch = detector.detectEventsForEntities(entities);
	for (const auto &entry : batch.reports) {
		printEntityReport(entry.second);
	}
	for (const auto &failure : batch.failures) {
		std::cout << "  " << failure.entity << " failed: " << failure.message << '\n';
	}

	std::cout << "\n=== Multi-entity events ===\n";
	const events::MultiEntityEventDetector multi(provider, {}, {}, pool);
	if (const auto correlated = multi.detectCorrelatedEvents(entities, {}, 0.5)) {
		for (const auto &pair : correlated->correlated_pairs) {
			std::cout << "  " << pair.entity1 << " ~ " << pair.entity2 << ": r = " << std::setprecision(3)
			          << pair.correlation << " (p = " << pair.p_value << ")\n";
		}
		std::cout << "  " << correlated->communities.size() << " communities\n";
	}
	if (const auto co_occurring = multi.detectCoOccurringEvents(entities)) {
		for (const auto &event : co_occurring->events) {
			std::cout << "  #" << event.id << ' ' << event.start_date << " .. " << event.end_date << ": "
			          << event.description << '\n';
		}
	}
	if (const auto causal = multi.detectCausalEvents(entities, {}, 5, 0.4)) {
		for (const auto &relationship : causal->relationships) {
			std::cout << "  " << relationship.cause << " leads " << relationship.effect << " by "
			          << relationship.lag << " days (r = " << relationship.correlation << ")\n";
		}
	}

	std::cout << "\n=== Cross-entity stories ===\n";
	const events::CrossEntityAnalyzer analyzer(store);
	for (const auto &event : analyzer.findCrossEntityEvents(entities)) {
		std::cout << "  peak " << event.peak_date << " with " << event.peak_count << " articles, "
		          << event.article_count << " in " << event.start_date << " .. " << event.end_date << '\n';
		if (!event.top_articles.empty()) {
			std::cout << "    top: " << event.top_articles.front().title << " (" << event.top_articles.front().source
			          << ")\n";
		}
	}

	std::cout << "\n=== Forecast ===\n";
	const prediction::Predictor predictor(provider, {}, pool);
	const auto prediction = predictor.predictEntityEvents("Northwind", {}, 14, 10.0);
	for (const auto &outcome : prediction.forecast.outcomes) {
		std::cout << "  " << std::setw(22) << std::left << outcome.model << std::right
		          << (outcome.succeeded() ? "ok" : "failed: " + outcome.error) << '\n';
	}
	for (const auto &point : prediction.forecast.ensemble.points) {
		std::cout << "  " << point.date << "  " << std::fixed << std::setprecision(1) << point.value << '\n';
	}
	std::cout << "  " << prediction.events.size() << " predicted events above " << prediction.threshold << '\n';

	const auto evaluation = predictor.evaluateModels("Northwind");
	for (const auto &model : evaluation.models) {
		if (model.succeeded()) {
			std::cout << "  " << model.model << " MAE " << std::setprecision(3) << model.metrics.mae << '\n';
		}
	}
	return 0;
}
