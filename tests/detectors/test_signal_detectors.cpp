#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/detectors/scoring.hpp"
#include "entity-pulse/detectors/signal_detectors.hpp"
#include "common/time_series_helpers.hpp"

#include <vector>

using namespace entitypulse::detectors;
using entitypulse::core::InvalidParameter;
using entitypulse::core::TimeSeries;

namespace {

std::vector<double> levelShift() {
	std::vector<double> values(15, 5.0);
	values.insert(values.end(), 15, 15.0);
	return values;
}

std::vector<double> weeklyWithSpike(std::size_t weeks, std::size_t spike_index, double extra) {
	auto values = tests::helpers::makeWeekly(weeks * 7);
	values[spike_index] += extra;
	return values;
}

} // namespace

TEST_CASE("Change points flag a level shift", "[detectors][change_point]") {
	const auto ts = tests::helpers::makeDailySeries(levelShift());
	ChangePointDetector detector(7, 2.0);
	const auto result = detector.detect(ts);

	REQUIRE(result.kind == DetectionKind::ChangePoint);
	REQUIRE(result.records.size() == ts.size());
	REQUIRE(result.find(15)->flagged);
	REQUIRE(result.find(15)->score == Catch::Approx(10.0));
	for (const auto &record : result.records) {
		REQUIRE(record.score <= result.find(15)->score);
	}
	// Only indices with a full window on both sides are scored.
	REQUIRE(result.find(3)->score == 0.0);
	REQUIRE(result.find(25)->score == 0.0);
	REQUIRE_FALSE(result.find(9)->flagged);
}

TEST_CASE("Change points need more than two windows", "[detectors][change_point]") {
	const auto ts = tests::helpers::makeDailySeries(std::vector<double>(14, 3.0));
	const auto result = ChangePointDetector(7, 2.0).detect(ts);
	REQUIRE(result.flaggedCount() == 0);
	REQUIRE_THROWS_AS(ChangePointDetector(0, 2.0), InvalidParameter);
	REQUIRE_THROWS_AS(ChangePointDetector(7, 0.0), InvalidParameter);
}

TEST_CASE("Seasonal detector flags a weekday outlier", "[detectors][seasonal]") {
	// Day 23 is a Wednesday; twelve weeks are needed for one value of a group to pass 3 std.
	const auto values = weeklyWithSpike(12, 23, 30.0);

	SECTION("calendar series") {
		const auto result = SeasonalDetector(7, 3.0).detect(tests::helpers::makeDailySeries(values));
		REQUIRE(result.flaggedIndices() == std::vector<std::size_t>{23});
		REQUIRE(result.find(23)->score > 3.0);
		REQUIRE(result.find(24)->score == 0.0);
	}

	SECTION("positional series groups by index modulo the period") {
		const auto result = SeasonalDetector(7, 3.0).detect(TimeSeries(values));
		REQUIRE(result.flaggedIndices() == std::vector<std::size_t>{23});
	}

	SECTION("short series are not scored") {
		const auto result = SeasonalDetector(7, 3.0).detect(tests::helpers::makeDailySeries(weeklyWithSpike(2, 3, 30.0)));
		REQUIRE(result.flaggedCount() == 0);
	}
}

TEST_CASE("Burst signal detector wraps burst scoring", "[detectors][burst]") {
	const auto ts = tests::helpers::makeDailySeries({2.0, 2.0, 2.0, 2.0, 20.0, 2.0, 2.0});
	BurstSignalDetector detector(3, 2.0);
	const auto result = detector.detect(ts);

	REQUIRE(result.kind == DetectionKind::Burst);
	REQUIRE(result.flaggedIndices() == std::vector<std::size_t>{4});
	REQUIRE(result.find(4)->date == ts.dateAt(4));
	REQUIRE_THROWS_AS(BurstSignalDetector(3, -1.0), InvalidParameter);
}

TEST_CASE("Detection names round-trip", "[detectors]") {
	REQUIRE(parseDetectionMethod(toString(DetectionMethod::LocalOutlierFactor)) == DetectionMethod::LocalOutlierFactor);
	REQUIRE(kindOf(DetectionMethod::ChangePoint) == DetectionKind::ChangePoint);
	REQUIRE(kindOf(DetectionMethod::IQR) == DetectionKind::Anomaly);
	REQUIRE_THROWS_AS(parseDetectionMethod("prophet"), InvalidParameter);
}
