#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace entitypulse::core {

/**
 * @class Date
 * @brief A proleptic Gregorian calendar day stored as days since 1970-01-01.
 *
 * Mention series are daily, so every timestamp is reduced to its UTC calendar day.
 */
class Date {
public:
	using TimePoint = std::chrono::system_clock::time_point;

	constexpr Date() = default;
	constexpr explicit Date(std::int64_t days_since_epoch) : days_(days_since_epoch) {
	}

	/// Builds a date from a civil year/month/day; throws InvalidParameter on impossible dates.
	static Date fromYMD(int year, unsigned month, unsigned day);

	/// Parses an ISO "YYYY-MM-DD" string.
	static Date parse(const std::string &text);

	/// Truncates a timestamp to its UTC calendar day.
	static Date fromTimePoint(TimePoint tp);

	TimePoint toTimePoint() const;

	constexpr std::int64_t daysSinceEpoch() const {
		return days_;
	}

	int year() const;
	unsigned month() const;
	unsigned day() const;

	/// Day of week with Monday = 0 ... Sunday = 6.
	int dayOfWeek() const;

	std::string toString() const;

	constexpr Date operator+(std::int64_t days) const {
		return Date(days_ + days);
	}
	constexpr Date operator-(std::int64_t days) const {
		return Date(days_ - days);
	}
	constexpr std::int64_t operator-(const Date &other) const {
		return days_ - other.days_;
	}
	Date &operator+=(std::int64_t days) {
		days_ += days;
		return *this;
	}

	constexpr bool operator==(const Date &other) const {
		return days_ == other.days_;
	}
	constexpr bool operator!=(const Date &other) const {
		return days_ != other.days_;
	}
	constexpr bool operator<(const Date &other) const {
		return days_ < other.days_;
	}
	constexpr bool operator<=(const Date &other) const {
		return days_ <= other.days_;
	}
	constexpr bool operator>(const Date &other) const {
		return days_ > other.days_;
	}
	constexpr bool operator>=(const Date &other) const {
		return days_ >= other.days_;
	}

private:
	std::int64_t days_ = 0;
};

std::ostream &operator<<(std::ostream &os, const Date &date);

/// Inclusive optional bounds used by every query.
struct DateRange {
	std::optional<Date> start;
	std::optional<Date> end;

	bool contains(const Date &date) const {
		return (!start || date >= *start) && (!end || date <= *end);
	}
};

} // namespace entitypulse::core

namespace std {
template <>
struct hash<entitypulse::core::Date> {
	size_t operator()(const entitypulse::core::Date &date) const noexcept {
		return std::hash<std::int64_t>{}(date.daysSinceEpoch());
	}
};
} // namespace std
