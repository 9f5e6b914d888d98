#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/data/in_memory_mention_store.hpp"
#include "entity-pulse/data/time_series_provider.hpp"
#include "common/time_series_helpers.hpp"

#include <algorithm>
#include <memory>

using entitypulse::core::DateRange;
using entitypulse::core::EntityNotFound;
using entitypulse::core::InvalidParameter;
using entitypulse::data::InMemoryMentionStore;
using entitypulse::data::ProviderOptions;
using entitypulse::data::TimeSeriesProvider;
using tests::helpers::firstDay;
using tests::helpers::makeArticle;

namespace {

std::shared_ptr<InMemoryMentionStore> sparseStore() {
	const auto day = firstDay();
	auto store = std::make_shared<InMemoryMentionStore>();
	store->addArticle(makeArticle(1, day, {"acme"}));
	store->addArticle(makeArticle(2, day, {"acme", "globex"}));
	store->addArticle(makeArticle(3, day + 3, {"acme"}));
	store->addArticle(makeArticle(4, day + 5, {"globex"}));
	return store;
}

} // namespace

TEST_CASE("Provider zero-fills days without mentions", "[data][provider]") {
	TimeSeriesProvider provider(sparseStore());
	const auto series = provider.load("acme");

	REQUIRE(series.entity() == "acme");
	REQUIRE(series.hasCalendar());
	REQUIRE(series.isContiguous());
	REQUIRE(series.getValues() == std::vector<double>{2.0, 0.0, 0.0, 1.0});
	REQUIRE(series.getDates().front() == firstDay());
	REQUIRE(series.getDates().back() == firstDay() + 3);
}

TEST_CASE("Provider honours inclusive date ranges", "[data][provider]") {
	TimeSeriesProvider provider(sparseStore());
	const auto day = firstDay();

	SECTION("range trims to observed days inside it") {
		const auto series = provider.load("acme", DateRange{day + 1, day + 10});
		REQUIRE(series.size() == 1);
		REQUIRE(series.dateAt(0) == day + 3);
	}

	SECTION("range without mentions gives an empty series") {
		const auto series = provider.load("acme", DateRange{day + 10, day + 20});
		REQUIRE(series.isEmpty());
		REQUIRE(series.entity() == "acme");
	}

	SECTION("reversed range is rejected") {
		REQUIRE_THROWS_AS(provider.load("acme", DateRange{day + 5, day}), InvalidParameter);
	}
}

TEST_CASE("Provider can pad to the requested bounds", "[data][provider]") {
	ProviderOptions options;
	options.fill_requested_range = true;
	TimeSeriesProvider provider(sparseStore(), options);
	const auto day = firstDay();

	const auto series = provider.load("acme", DateRange{day - 2, day + 6});
	REQUIRE(series.size() == 9);
	REQUIRE(series.dateAt(0) == day - 2);
	REQUIRE(series.total() == Catch::Approx(3.0));
	REQUIRE(series[8] == Catch::Approx(0.0));
}

TEST_CASE("Provider raises for unknown entities", "[data][provider]") {
	TimeSeriesProvider provider(sparseStore());
	try {
		provider.load("initech");
		FAIL("expected EntityNotFound");
	} catch (const EntityNotFound &e) {
		REQUIRE(e.entity() == "initech");
	}
	REQUIRE_THROWS_AS(TimeSeriesProvider(nullptr), InvalidParameter);
}

TEST_CASE("Provider loads are idempotent", "[data][provider]") {
	TimeSeriesProvider provider(sparseStore());
	REQUIRE(provider.load("globex") == provider.load("globex"));
}

TEST_CASE("Provider batches skip empty and unknown entities", "[data][provider]") {
	TimeSeriesProvider provider(sparseStore());
	const auto day = firstDay();
	const auto batch = provider.loadMany({"acme", "globex", "initech"}, DateRange{day + 4, day + 6});

	REQUIRE(batch.series.size() == 1);
	REQUIRE(batch.series.count("globex") == 1);
	REQUIRE(batch.missing == std::vector<std::string>{"initech"});
	REQUIRE_FALSE(batch.empty());
}

TEST_CASE("In-memory store keeps articles ordered by time", "[data][store]") {
	const auto day = firstDay();
	InMemoryMentionStore store;
	store.addArticle(makeArticle(2, day + 2, {"b"}));
	store.addArticle(makeArticle(1, day, {"a", "b"}));

	REQUIRE(store.size() == 2);
	REQUIRE(store.containsEntity("a"));
	REQUIRE_FALSE(store.containsEntity("c"));

	const auto any = store.articlesMentioningAny({"a", "b"}, {});
	REQUIRE(any.size() == 2);
	REQUIRE(any.front().id == 1);
	REQUIRE(store.articlesMentioning("a", DateRange{day + 1, std::nullopt}).empty());
}
