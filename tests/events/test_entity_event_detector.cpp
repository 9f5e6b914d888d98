#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/events/entity_event_detector.hpp"
#include "entity-pulse/utils/worker_pool.hpp"
#include "common/time_series_helpers.hpp"

#include <algorithm>
#include <cmath>
#include <memory>

using namespace entitypulse::events;
using entitypulse::core::Date;
using entitypulse::core::DateRange;
using entitypulse::core::EntityNotFound;
using entitypulse::core::InvalidParameter;
using entitypulse::detectors::DetectionKind;
using tests::helpers::firstDay;

namespace {

RawEvent raw(std::int64_t day, DetectionKind type, double score, double value = 1.0) {
	RawEvent event;
	event.date = event.start_date = event.end_date = firstDay() + day;
	event.type = type;
	event.score = score;
	event.value = value;
	event.description = "day " + std::to_string(day);
	return event;
}

std::vector<double> spikyBaseline() {
	auto values = tests::helpers::makeBaseline(40);
	values[30] = 60.0;
	return values;
}

bool coversDay(const CombinedEvent &event, const Date &day) {
	return event.start_date <= day && day <= event.end_date;
}

} // namespace

TEST_CASE("Raw detections merge around the representative date", "[events][merge]") {
	// Given out of order; day 5 joins because the representative moves to day 2.
	const std::vector<RawEvent> detections{raw(9, DetectionKind::Anomaly, 3.0), raw(5, DetectionKind::ChangePoint, 1.0),
	                                       raw(0, DetectionKind::Anomaly, 2.0), raw(2, DetectionKind::Burst, 5.0, 40.0)};
	const auto merged = mergeRawEvents("acme", detections, 3);

	REQUIRE(merged.size() == 2);
	const auto &first = merged[0];
	REQUIRE(first.entity == "acme");
	REQUIRE(first.date == firstDay() + 2);
	REQUIRE(first.value == Catch::Approx(40.0));
	REQUIRE(first.description == "day 2");
	REQUIRE(first.start_date == firstDay());
	REQUIRE(first.end_date == firstDay() + 5);
	REQUIRE(first.raw_count == 3);
	REQUIRE(first.methods ==
	        std::set<DetectionKind>{DetectionKind::Anomaly, DetectionKind::Burst, DetectionKind::ChangePoint});
	REQUIRE(first.score == Catch::Approx((2.0 + 5.0 + 1.0) / 3.0));
	REQUIRE(first.peak_score == Catch::Approx(5.0));

	REQUIRE(merged[1].date == firstDay() + 9);
	REQUIRE(merged[1].raw_count == 1);
	REQUIRE(merged[1].score == Catch::Approx(3.0));
}

TEST_CASE("Merged score averages each method's best score", "[events][merge]") {
	const std::vector<RawEvent> detections{raw(0, DetectionKind::Anomaly, 2.0), raw(1, DetectionKind::Anomaly, 4.0),
	                                       raw(2, DetectionKind::Burst, 1.0)};
	const auto merged = mergeRawEvents("acme", detections, 3);
	REQUIRE(merged.size() == 1);
	REQUIRE(merged[0].score == Catch::Approx((4.0 + 1.0) / 2.0));
	REQUIRE(merged[0].date == firstDay() + 1);
}

TEST_CASE("Distant detections stay separate", "[events][merge]") {
	const std::vector<RawEvent> detections{raw(0, DetectionKind::Anomaly, 1.0), raw(5, DetectionKind::Burst, 1.0)};
	REQUIRE(mergeRawEvents("acme", detections, 3).size() == 2);
	REQUIRE(mergeRawEvents("acme", detections, 5).size() == 1);
	REQUIRE(mergeRawEvents("acme", {}, 3).empty());
}

TEST_CASE("Entity events combine every detection method", "[events][entity]") {
	auto store = tests::helpers::makeStore({{"acme", spikyBaseline()}});
	const EntityEventDetector detector(tests::helpers::makeProvider(store));

	const auto report = detector.detectEntityEvents("acme");
	REQUIRE(report.has_value());
	REQUIRE(report->entity == "acme");
	REQUIRE(report->start_date == firstDay());
	REQUIRE(report->end_date == firstDay() + 39);
	REQUIRE(report->max_daily_mentions == Catch::Approx(60.0));

	double expected_total = 0.0;
	for (const double value : spikyBaseline()) {
		expected_total += static_cast<double>(std::lround(value));
	}
	REQUIRE(report->total_mentions == Catch::Approx(expected_total));
	REQUIRE(report->avg_daily_mentions == Catch::Approx(expected_total / 40.0));

	const Date spike = firstDay() + 30;
	REQUIRE(std::any_of(report->bursts.begin(), report->bursts.end(),
	                    [&](const RawEvent &event) { return event.date == spike && event.value == 60.0; }));
	for (const auto &burst : report->bursts) {
		REQUIRE(burst.type == DetectionKind::Burst);
		REQUIRE(burst.description.find("Burst in mentions for acme") == 0);
	}
	REQUIRE(std::any_of(report->events.begin(), report->events.end(), [&](const CombinedEvent &event) {
		return coversDay(event, spike) && event.methods.count(DetectionKind::Burst) > 0;
	}));
	for (std::size_t i = 1; i < report->events.size(); ++i) {
		REQUIRE(report->events[i - 1].date < report->events[i].date);
	}
}

TEST_CASE("Method selection limits the raw detections", "[events][entity]") {
	auto store = tests::helpers::makeStore({{"acme", spikyBaseline()}});
	EntityEventConfig config;
	config.methods = {DetectionKind::Burst};
	const EntityEventDetector detector(tests::helpers::makeProvider(store), config);

	const auto report = detector.detectEntityEvents("acme");
	REQUIRE(report.has_value());
	REQUIRE(report->anomalies.empty());
	REQUIRE(report->change_points.empty());
	REQUIRE_FALSE(report->bursts.empty());
	for (const auto &event : report->events) {
		REQUIRE(event.methods == std::set<DetectionKind>{DetectionKind::Burst});
	}
}

TEST_CASE("Missing and empty entities", "[events][entity]") {
	auto store = tests::helpers::makeStore({{"acme", spikyBaseline()}});
	store->addArticle(tests::helpers::makeArticle(9999, firstDay() - 50, {"archived"}));
	const EntityEventDetector detector(tests::helpers::makeProvider(store));

	REQUIRE_THROWS_AS(detector.detectEntityEvents("ghost"), EntityNotFound);
	const DateRange range{firstDay(), firstDay() + 39};
	REQUIRE_FALSE(detector.detectEntityEvents("archived", range).has_value());
	REQUIRE_THROWS_AS(detector.analyzeSeries(entitypulse::core::TimeSeries(spikyBaseline())), InvalidParameter);
}

TEST_CASE("Batch detection records empty and failed entities", "[events][entity]") {
	auto store = tests::helpers::makeStore({{"acme", spikyBaseline()}, {"globex", tests::helpers::makeBaseline(40)}});
	store->addArticle(tests::helpers::makeArticle(9999, firstDay() - 50, {"archived"}));
	auto pool = std::make_shared<entitypulse::utils::WorkerPool>(2);
	const EntityEventDetector detector(tests::helpers::makeProvider(store), {}, pool);

	const DateRange range{firstDay(), firstDay() + 39};
	const auto batch = detector.detectEventsForEntities({"acme", "globex", "archived", "ghost"}, range);

	REQUIRE(batch.reports.size() == 2);
	REQUIRE(batch.reports.count("acme") == 1);
	REQUIRE(batch.reports.count("globex") == 1);
	REQUIRE(batch.empty == std::vector<std::string>{"archived"});
	REQUIRE(batch.failures.size() == 1);
	REQUIRE(batch.failures[0].entity == "ghost");
	REQUIRE_FALSE(batch.failures[0].message.empty());
}

TEST_CASE("Entity event configuration is validated", "[events][entity]") {
	auto provider = tests::helpers::makeProvider(tests::helpers::makeStore({{"acme", {1, 2, 3}}}));
	EntityEventConfig config;
	config.methods.clear();
	REQUIRE_THROWS_AS(EntityEventDetector(provider, config), InvalidParameter);
	config.methods = {DetectionKind::Seasonal};
	REQUIRE_THROWS_AS(EntityEventDetector(provider, config), InvalidParameter);
	REQUIRE_THROWS_AS(EntityEventDetector(nullptr), InvalidParameter);
}
