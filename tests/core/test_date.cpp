#include <catch2/catch_test_macros.hpp>

#include "entity-pulse/core/date.hpp"
#include "entity-pulse/core/errors.hpp"

#include <chrono>
#include <sstream>
#include <unordered_set>

using entitypulse::core::Date;
using entitypulse::core::DateRange;
using entitypulse::core::InvalidParameter;

TEST_CASE("Date converts between civil days and epoch days", "[core][date]") {
	REQUIRE(Date::fromYMD(1970, 1, 1).daysSinceEpoch() == 0);
	REQUIRE(Date::fromYMD(2000, 3, 1).daysSinceEpoch() == 11017);

	const auto leap = Date::fromYMD(2024, 2, 29);
	REQUIRE(leap.year() == 2024);
	REQUIRE(leap.month() == 2);
	REQUIRE(leap.day() == 29);
	REQUIRE((leap + 1).toString() == "2024-03-01");
	REQUIRE((leap - Date::fromYMD(2024, 1, 1)) == 59);

	REQUIRE_THROWS_AS(Date::fromYMD(2023, 2, 29), InvalidParameter);
	REQUIRE_THROWS_AS(Date::fromYMD(2024, 13, 1), InvalidParameter);
}

TEST_CASE("Date parses and prints ISO dates", "[core][date]") {
	const auto date = Date::parse("2024-01-15");
	REQUIRE(date.toString() == "2024-01-15");

	std::ostringstream os;
	os << date;
	REQUIRE(os.str() == "2024-01-15");

	REQUIRE_THROWS_AS(Date::parse("15/01/2024"), InvalidParameter);
	REQUIRE_THROWS_AS(Date::parse("2024-01-15x"), InvalidParameter);
	REQUIRE_THROWS_AS(Date::parse("2024-02-30"), InvalidParameter);
}

TEST_CASE("Date reports the weekday with Monday as zero", "[core][date]") {
	REQUIRE(Date::fromYMD(2024, 1, 1).dayOfWeek() == 0);
	REQUIRE(Date::fromYMD(2024, 1, 7).dayOfWeek() == 6);
	REQUIRE(Date::fromYMD(1970, 1, 1).dayOfWeek() == 3);
	REQUIRE(Date::fromYMD(1969, 12, 31).dayOfWeek() == 2);
}

TEST_CASE("Date truncates timestamps to their UTC day", "[core][date]") {
	const auto day = Date::fromYMD(2024, 5, 10);
	const auto midnight = day.toTimePoint();
	REQUIRE(Date::fromTimePoint(midnight) == day);
	REQUIRE(Date::fromTimePoint(midnight + std::chrono::hours(23) + std::chrono::minutes(59)) == day);
	REQUIRE(Date::fromTimePoint(midnight - std::chrono::seconds(1)) == day - 1);
}

TEST_CASE("DateRange bounds are inclusive and optional", "[core][date]") {
	const auto start = Date::fromYMD(2024, 1, 10);
	const auto end = Date::fromYMD(2024, 1, 20);

	DateRange open;
	REQUIRE(open.contains(start));

	DateRange bounded{start, end};
	REQUIRE(bounded.contains(start));
	REQUIRE(bounded.contains(end));
	REQUIRE_FALSE(bounded.contains(start - 1));
	REQUIRE_FALSE(bounded.contains(end + 1));

	DateRange from{start, std::nullopt};
	REQUIRE(from.contains(end + 100));
	REQUIRE_FALSE(from.contains(start - 1));

	std::unordered_set<Date> set{start, end, start};
	REQUIRE(set.size() == 2);
}
