#include "entity-pulse/core/date.hpp"
#include "entity-pulse/core/errors.hpp"

#include <cstdio>

namespace entitypulse::core {

namespace {

constexpr std::int64_t seconds_per_day = 86400;

// Civil calendar conversions on the proleptic Gregorian calendar, counted in 400-year eras.
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
	y -= m <= 2 ? 1 : 0;
	const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
	const unsigned yoe = static_cast<unsigned>(y - era * 400);
	const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct Civil {
	std::int64_t year;
	unsigned month;
	unsigned day;
};

Civil civil_from_days(std::int64_t z) {
	z += 719468;
	const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
	const unsigned doe = static_cast<unsigned>(z - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	const unsigned d = doy - (153 * mp + 2) / 5 + 1;
	const unsigned m = mp < 10 ? mp + 3 : mp - 9;
	return {y + (m <= 2 ? 1 : 0), m, d};
}

bool is_leap(std::int64_t y) {
	return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(std::int64_t y, unsigned m) {
	static const unsigned lengths[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	return (m == 2 && is_leap(y)) ? 29u : lengths[m - 1];
}

} // namespace

Date Date::fromYMD(int year, unsigned month, unsigned day) {
	if (month < 1 || month > 12) {
		throw InvalidParameter("Month must be in [1, 12].");
	}
	if (day < 1 || day > days_in_month(year, month)) {
		throw InvalidParameter("Day out of range for the given month.");
	}
	return Date(days_from_civil(year, month, day));
}

Date Date::parse(const std::string &text) {
	int year = 0;
	unsigned month = 0;
	unsigned day = 0;
	char trailing = '\0';
	if (std::sscanf(text.c_str(), "%d-%u-%u%c", &year, &month, &day, &trailing) != 3) {
		throw InvalidParameter("Expected a date formatted as YYYY-MM-DD, got '" + text + "'.");
	}
	return fromYMD(year, month, day);
}

Date Date::fromTimePoint(TimePoint tp) {
	const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
	std::int64_t days = seconds / seconds_per_day;
	if (seconds % seconds_per_day < 0) {
		--days;
	}
	return Date(days);
}

Date::TimePoint Date::toTimePoint() const {
	return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::seconds(days_ * seconds_per_day)));
}

int Date::year() const {
	return static_cast<int>(civil_from_days(days_).year);
}

unsigned Date::month() const {
	return civil_from_days(days_).month;
}

unsigned Date::day() const {
	return civil_from_days(days_).day;
}

int Date::dayOfWeek() const {
	// 1970-01-01 was a Thursday (index 3 with Monday = 0).
	const std::int64_t shifted = (days_ + 3) % 7;
	return static_cast<int>(shifted < 0 ? shifted + 7 : shifted);
}

std::string Date::toString() const {
	const Civil civil = civil_from_days(days_);
	char buffer[32];
	std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u", static_cast<long long>(civil.year), civil.month,
	              civil.day);
	return buffer;
}

std::ostream &operator<<(std::ostream &os, const Date &date) {
	return os << date.toString();
}

} // namespace entitypulse::core
