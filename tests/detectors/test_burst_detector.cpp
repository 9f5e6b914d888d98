#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/detectors/burst_detector.hpp"
#include "entity-pulse/utils/worker_pool.hpp"
#include "common/time_series_helpers.hpp"

#include <cmath>
#include <map>
#include <memory>
#include <vector>

using namespace entitypulse::detectors;
using entitypulse::core::InvalidParameter;
using entitypulse::core::TimeSeries;
using tests::helpers::firstDay;
using tests::helpers::makeDailySeries;

namespace {

BurstDetector detectorWith(std::size_t window, std::size_t max_gap = 1, std::size_t min_duration = 1) {
	BurstDetectorConfig config;
	config.window_size = window;
	config.max_burst_gap = max_gap;
	config.min_burst_duration = min_duration;
	return BurstDetector(config);
}

std::vector<double> flatWithSpikes(std::size_t n, const std::map<std::size_t, double> &spikes) {
	std::vector<double> values(n, 2.0);
	for (const auto &spike : spikes) {
		values[spike.first] = spike.second;
	}
	return values;
}

} // namespace

TEST_CASE("A single spike forms one burst event", "[detectors][burst]") {
	const auto ts = makeDailySeries({2, 2, 2, 2, 20, 2, 2});
	const auto events = detectorWith(3).detectBurstEvents(ts);

	REQUIRE(events.size() == 1);
	const auto &event = events.front();
	REQUIRE(event.peak_index == 4);
	REQUIRE(event.peak_date == ts.dateAt(4));
	REQUIRE(event.peak_value == Catch::Approx(20.0));
	REQUIRE(event.duration == 1);
	REQUIRE(event.values == std::vector<double>{20.0});
	REQUIRE(event.dates == std::vector<entitypulse::core::Date>{ts.dateAt(4)});
}

TEST_CASE("Burst scores are zero at the baseline and never flag decreases", "[detectors][burst]") {
	std::vector<double> values;
	for (int i = 0; i < 40; ++i) {
		values.push_back(10.0 + 6.0 * std::sin(0.9 * i) + ((i % 11 == 0) ? 25.0 : 0.0));
	}
	values.push_back(values.back());
	const auto scores = detectorWith(3).detectBursts(makeDailySeries(values));

	REQUIRE(scores.size() == values.size());
	for (const auto &score : scores) {
		if (score.value < score.rolling_mean) {
			REQUIRE_FALSE(score.is_burst);
			REQUIRE(score.score < 0.0);
		}
		if (score.value == score.rolling_mean) {
			REQUIRE(score.score == 0.0);
		}
	}
	// A sharp drop after a flat stretch has a large magnitude but is no burst.
	const auto drop = detectorWith(3).detectBursts(makeDailySeries({10, 10, 10, 10, 0}));
	REQUIRE(drop[4].score < -2.0);
	REQUIRE_FALSE(drop[4].is_burst);
}

TEST_CASE("Flagged days group by the gap from the last flagged day", "[detectors][burst]") {
	// Days 5 and 7 are flagged; day 6 sits below its baseline.
	const auto ts = makeDailySeries(flatWithSpikes(12, {{5, 20.0}, {7, 100.0}}));

	SECTION("gap of one day splits them") {
		const auto events = detectorWith(3, 1).detectBurstEvents(ts);
		REQUIRE(events.size() == 2);
		REQUIRE(events[0].duration == 1);
		REQUIRE(events[1].peak_index == 7);
	}

	SECTION("gap of two days joins them") {
		const auto events = detectorWith(3, 2).detectBurstEvents(ts);
		REQUIRE(events.size() == 1);
		REQUIRE(events[0].start_index == 5);
		REQUIRE(events[0].end_index == 7);
		REQUIRE(events[0].duration == 3);
		REQUIRE(events[0].values == std::vector<double>{20.0, 100.0});
		REQUIRE(events[0].peak_index == 7);
	}

	SECTION("events shorter than the minimum duration are dropped") {
		REQUIRE(detectorWith(3, 1, 2).detectBurstEvents(ts).empty());
		const auto events = detectorWith(3, 2, 2).detectBurstEvents(ts);
		REQUIRE(events.size() == 1);
		for (const auto &event : events) {
			REQUIRE(event.duration >= 2);
		}
	}
}

TEST_CASE("Series not longer than the window have no bursts", "[detectors][burst]") {
	const auto scores = detectorWith(3).detectBursts(makeDailySeries({1, 50, 1}));
	for (const auto &score : scores) {
		REQUIRE(score.score == 0.0);
		REQUIRE_FALSE(score.is_burst);
	}
	REQUIRE(detectorWith(3).detectBurstEvents(makeDailySeries({})).empty());
}

TEST_CASE("Peaks carry prominence and width", "[detectors][burst][peaks]") {
	const auto ts = makeDailySeries({0, 1, 0, 5, 0, 2, 0});
	const auto detector = detectorWith(3);

	const auto peaks = detector.detectPeaks(ts, 1.0, 1.0);
	REQUIRE(peaks.size() == 3);
	REQUIRE(peaks[0].index == 3);
	REQUIRE(peaks[0].prominence == Catch::Approx(5.0));
	REQUIRE(peaks[0].width == Catch::Approx(1.0));
	REQUIRE(peaks[1].index == 5);
	REQUIRE(peaks[1].prominence == Catch::Approx(2.0));
	REQUIRE(peaks[2].index == 1);

	REQUIRE(detector.detectPeaks(ts, 1.5, 1.0).size() == 2);
	REQUIRE(detector.detectPeaks(ts, 1.0, 1.5).empty());
	REQUIRE_THROWS_AS(detector.detectPeaks(ts, -1.0, 1.0), InvalidParameter);
}

TEST_CASE("Peak prominence is measured against the higher base", "[detectors][burst][peaks]") {
	// The peak at 3 is bounded on the right by the higher peak at 7.
	const auto ts = makeDailySeries({0, 2, 4, 6, 3, 5, 8, 9, 1});
	const auto peaks = detectorWith(3).detectPeaks(ts, 0.0, 0.0);

	REQUIRE(peaks.size() == 2);
	REQUIRE(peaks[0].index == 7);
	REQUIRE(peaks[0].prominence == Catch::Approx(8.0));
	REQUIRE(peaks[1].index == 3);
	REQUIRE(peaks[1].prominence == Catch::Approx(3.0));
	REQUIRE(peaks[1].left_base == 0);
	REQUIRE(peaks[1].right_base == 4);
}

TEST_CASE("Multi-scale bursts average scores and OR flags", "[detectors][burst][multi_scale]") {
	auto values = flatWithSpikes(40, {{35, 30.0}});
	values[10] = 3.0;
	const auto ts = makeDailySeries(values);
	const auto result = detectorWith(3).detectMultiScaleBursts(ts, {3, 7});

	REQUIRE(result.scales == std::vector<std::size_t>{3, 7});
	REQUIRE(result.rows.size() == ts.size());
	for (const auto &row : result.rows) {
		REQUIRE(row.scores.size() == 2);
		REQUIRE(row.combined_score == Catch::Approx((row.scores[0] + row.scores[1]) / 2.0));
		REQUIRE(row.is_combined_burst == (row.flags[0] || row.flags[1]));
	}
	REQUIRE(result.rows[35].is_combined_burst);
	REQUIRE(result.rows[35].flags[0]);
	REQUIRE(result.rows[35].flags[1]);

	REQUIRE_THROWS_AS(detectorWith(3).detectMultiScaleBursts(ts, {}), InvalidParameter);
	REQUIRE_THROWS_AS(detectorWith(3).detectMultiScaleBursts(ts, {3, 0}), InvalidParameter);
}

TEST_CASE("Cross-entity bursts need two entities on the same day", "[detectors][burst][cross_entity]") {
	std::map<std::string, TimeSeries> series;
	series.emplace("a", makeDailySeries(flatWithSpikes(20, {{10, 20.0}}), "a"));
	series.emplace("b", makeDailySeries(flatWithSpikes(20, {{10, 20.0}, {13, 60.0}}), "b"));
	series.emplace("c", makeDailySeries(flatWithSpikes(20, {{13, 20.0}}), "c"));
	series.emplace("d", makeDailySeries(flatWithSpikes(20, {{17, 20.0}}), "d"));

	SECTION("separate days stay separate") {
		const auto bursts = detectorWith(3, 1).detectEntityCorrelationBursts(series);
		REQUIRE(bursts.size() == 2);
		REQUIRE(bursts[0].start_date == firstDay() + 10);
		REQUIRE(bursts[0].entities == std::vector<std::string>{"a", "b"});
		REQUIRE(bursts[1].start_date == firstDay() + 13);
		REQUIRE(bursts[1].entities == std::vector<std::string>{"b", "c"});
	}

	SECTION("a wider gap merges them") {
		auto pool = std::make_shared<entitypulse::utils::WorkerPool>(2);
		BurstDetectorConfig config;
		config.max_burst_gap = 3;
		const auto bursts = BurstDetector(config, pool).detectEntityCorrelationBursts(series);
		REQUIRE(bursts.size() == 1);
		REQUIRE(bursts[0].entities == std::vector<std::string>{"a", "b", "c"});
		REQUIRE(bursts[0].dates.size() == 2);
		REQUIRE(bursts[0].end_date == firstDay() + 13);
	}

	SECTION("positional series are rejected") {
		series.emplace("e", TimeSeries(flatWithSpikes(20, {})));
		REQUIRE_THROWS_AS(detectorWith(3).detectEntityCorrelationBursts(series), InvalidParameter);
	}
}

TEST_CASE("Burst configuration is validated", "[detectors][burst]") {
	BurstDetectorConfig config;
	config.sensitivity = 0.0;
	REQUIRE_THROWS_AS(BurstDetector(config), InvalidParameter);
	config = BurstDetectorConfig{};
	config.window_size = 0;
	REQUIRE_THROWS_AS(BurstDetector(config), InvalidParameter);
	config = BurstDetectorConfig{};
	config.min_burst_duration = 0;
	REQUIRE_THROWS_AS(BurstDetector(config), InvalidParameter);
}
