#pragma once

#include "entity-pulse/core/date.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace entitypulse::core {

/**
 * @class TimeSeries
 * @brief A univariate daily mention series for one entity.
 *
 * Values are stored contiguously for numerical processing. A series is either calendar
 * indexed (one strictly increasing Date per value) or positional, in which case only the
 * index of each value is known. Detectors that need a weekday fall back to index modulo 7
 * for positional series.
 */
class TimeSeries {
public:
	using Value = double;

	TimeSeries() = default;

	/**
	 * @brief Builds a calendar-indexed series.
	 * @param dates Strictly increasing calendar days, one per value.
	 * @param values Observations aligned with @p dates.
	 * @param entity Identifier of the entity the series belongs to.
	 */
	TimeSeries(std::vector<Date> dates, std::vector<Value> values, std::string entity = {});

	/// Builds a positional series without calendar information.
	explicit TimeSeries(std::vector<Value> values, std::string entity = {});

	const std::vector<Date> &getDates() const {
		return dates_;
	}
	const std::vector<Value> &getValues() const {
		return values_;
	}
	const std::string &entity() const {
		return entity_;
	}

	bool hasCalendar() const {
		return has_calendar_;
	}
	std::size_t size() const {
		return values_.size();
	}
	bool isEmpty() const {
		return values_.empty();
	}

	Value operator[](std::size_t index) const {
		return values_[index];
	}

	/// Calendar day of an observation; throws std::logic_error for positional series.
	Date dateAt(std::size_t index) const;

	/// Calendar day of an observation, or nullopt for positional series.
	std::optional<Date> maybeDateAt(std::size_t index) const;

	/// Index of a calendar day, if present.
	std::optional<std::size_t> indexOf(const Date &date) const;

	/// Day of week (Monday = 0) or index modulo 7 without a calendar.
	int weekdayAt(std::size_t index) const;

	/// Offset between two observations in days (calendar) or positions.
	std::int64_t distance(std::size_t from, std::size_t to) const;

	/// Half-open sub-series [start, end).
	TimeSeries slice(std::size_t start, std::size_t end) const;

	/// True when consecutive calendar days differ by exactly one day.
	bool isContiguous() const;

	Value total() const;
	Value mean() const;
	Value maxValue() const;

	bool operator==(const TimeSeries &other) const;
	bool operator!=(const TimeSeries &other) const {
		return !(*this == other);
	}

private:
	std::vector<Date> dates_;
	std::vector<Value> values_;
	std::string entity_;
	bool has_calendar_ = false;
};

} // namespace entitypulse::core
