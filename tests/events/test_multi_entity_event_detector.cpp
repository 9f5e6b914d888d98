#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/events/multi_entity_event_detector.hpp"
#include "entity-pulse/utils/worker_pool.hpp"
#include "common/time_series_helpers.hpp"

#include <map>
#include <memory>
#include <vector>

using namespace entitypulse::events;
using entitypulse::core::InvalidParameter;
using tests::helpers::firstDay;
using tests::helpers::makeProvider;
using tests::helpers::makeStore;

namespace {

std::vector<double> linear(std::size_t n, double slope, double intercept) {
	std::vector<double> values;
	for (std::size_t i = 0; i < n; ++i) {
		values.push_back(intercept + slope * static_cast<double>(i));
	}
	return values;
}

std::vector<double> alternating(std::size_t n, double amplitude) {
	std::vector<double> values;
	for (std::size_t i = 0; i < n; ++i) {
		values.push_back(10.0 + ((i % 2 == 0) ? amplitude : -amplitude));
	}
	return values;
}

std::vector<double> flatWithSpikes(std::size_t n, const std::map<std::size_t, double> &spikes) {
	std::vector<double> values(n, 2.0);
	for (const auto &spike : spikes) {
		values[spike.first] = spike.second;
	}
	return values;
}

// Whole-number counts without periodic structure.
std::vector<double> irregular(std::size_t n) {
	std::vector<double> values;
	for (std::size_t t = 0; t < n; ++t) {
		values.push_back(1.0 + static_cast<double>(t * 37 % 17) + static_cast<double>(t * t % 7));
	}
	return values;
}

MultiEntityEventDetector detectorFor(const std::map<std::string, std::vector<double>> &counts,
                                     std::shared_ptr<entitypulse::utils::WorkerPool> pool = nullptr) {
	return MultiEntityEventDetector(makeProvider(makeStore(counts)), {}, {}, std::move(pool));
}

} // namespace

TEST_CASE("Correlated events report pairs, network and communities", "[events][multi]") {
	const auto detector = detectorFor({{"alpha", linear(12, 1.0, 1.0)},
	                                   {"beta", linear(12, 2.0, 5.0)},
	                                   {"gamma", alternating(12, 1.0)},
	                                   {"delta", alternating(12, 3.0)}});

	const auto report = detector.detectCorrelatedEvents({"alpha", "beta", "gamma", "delta", "ghost"});
	REQUIRE(report.has_value());
	REQUIRE(report->entities == std::vector<std::string>{"alpha", "beta", "delta", "gamma"});
	REQUIRE(report->min_correlation == Catch::Approx(0.7));
	REQUIRE(report->matrix.coefficient("alpha", "beta") == Catch::Approx(1.0));

	REQUIRE(report->correlated_pairs.size() == 2);
	REQUIRE(report->correlated_pairs[0].entity1 == "alpha");
	REQUIRE(report->correlated_pairs[0].entity2 == "beta");
	REQUIRE(report->correlated_pairs[1].entity1 == "delta");
	REQUIRE(report->correlated_pairs[1].entity2 == "gamma");

	REQUIRE(report->network.edgeCount() == 2);
	REQUIRE(report->communities.size() == 2);
	REQUIRE(report->communities[0] == entitypulse::graph::Community{"alpha", "beta"});
}

TEST_CASE("Co-occurring events merge shared burst days", "[events][multi]") {
	auto pool = std::make_shared<entitypulse::utils::WorkerPool>(2);
	const auto detector = detectorFor({{"a", flatWithSpikes(20, {{10, 20.0}})},
	                                   {"b", flatWithSpikes(20, {{10, 20.0}, {13, 60.0}})},
	                                   {"c", flatWithSpikes(20, {{13, 20.0}})}},
	                                  pool);

	SECTION("days within the gap form one event") {
		const auto report = detector.detectCoOccurringEvents({"a", "b", "c"});
		REQUIRE(report.has_value());
		REQUIRE(report->max_days_gap == 3);
		REQUIRE(report->events.size() == 1);
		const auto &event = report->events[0];
		REQUIRE(event.id == 1);
		REQUIRE(event.start_date == firstDay() + 10);
		REQUIRE(event.end_date == firstDay() + 13);
		REQUIRE(event.entities == std::vector<std::string>{"a", "b", "c"});
		REQUIRE(event.duration == 2);
		REQUIRE(event.description == "Co-occurring burst involving 3 entities");
	}

	SECTION("a one-day gap splits them") {
		const auto report = detector.detectCoOccurringEvents({"a", "b", "c"}, {}, 1);
		REQUIRE(report.has_value());
		REQUIRE(report->events.size() == 2);
		REQUIRE(report->events[0].id == 1);
		REQUIRE(report->events[1].id == 2);
		REQUIRE(report->events[0].entities == std::vector<std::string>{"a", "b"});
		REQUIRE(report->events[1].entities == std::vector<std::string>{"b", "c"});
		REQUIRE(report->events[1].duration == 1);
	}
}

TEST_CASE("Causal events point from the leading entity", "[events][multi]") {
	const auto leader = irregular(30);
	std::vector<double> follower{5.0, 3.0};
	follower.insert(follower.end(), leader.begin(), leader.end() - 2);
	const auto detector = detectorFor({{"leader", leader}, {"follower", follower}});

	const auto report = detector.detectCausalEvents({"leader", "follower"});
	REQUIRE(report.has_value());
	REQUIRE(report->max_lag == 7);
	REQUIRE(report->min_correlation == Catch::Approx(0.5));
	REQUIRE(report->network.isDirected());
	REQUIRE(report->relationships.size() == 1);
	REQUIRE(report->relationships[0].cause == "leader");
	REQUIRE(report->relationships[0].effect == "follower");
	REQUIRE(report->relationships[0].lag == 2);

	const auto short_lag = detector.detectCausalEvents({"leader", "follower"}, {}, 1);
	REQUIRE(short_lag.has_value());
	for (const auto &relationship : short_lag->relationships) {
		REQUIRE(relationship.lag <= 1);
	}
}

TEST_CASE("Operations without any data return nothing", "[events][multi]") {
	const auto detector = detectorFor({{"alpha", linear(12, 1.0, 1.0)}});
	const entitypulse::core::DateRange later{firstDay() + 100, firstDay() + 120};

	REQUIRE_FALSE(detector.detectCorrelatedEvents({"ghost"}).has_value());
	REQUIRE_FALSE(detector.detectCoOccurringEvents({"alpha"}, later).has_value());
	REQUIRE_FALSE(detector.detectCausalEvents({}).has_value());
}

TEST_CASE("Multi-entity configuration is validated", "[events][multi]") {
	auto provider = makeProvider(makeStore({{"alpha", {1, 2}}}));
	entitypulse::correlation::CorrelationConfig correlation;
	correlation.max_lag = -1;
	REQUIRE_THROWS_AS(MultiEntityEventDetector(provider, correlation), InvalidParameter);
	REQUIRE_THROWS_AS(MultiEntityEventDetector(nullptr), InvalidParameter);

	const MultiEntityEventDetector detector(provider);
	REQUIRE_THROWS_AS(detector.detectCausalEvents({"alpha"}, {}, -2), InvalidParameter);
}
