#include "entity-pulse/core/time_series.hpp"
#include "entity-pulse/core/errors.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace entitypulse::core {

TimeSeries::TimeSeries(std::vector<Date> dates, std::vector<Value> values, std::string entity)
    : dates_(std::move(dates)), values_(std::move(values)), entity_(std::move(entity)), has_calendar_(true) {
	if (dates_.size() != values_.size()) {
		throw InvalidParameter("Number of dates must match number of values.");
	}
	for (std::size_t i = 1; i < dates_.size(); ++i) {
		if (dates_[i] <= dates_[i - 1]) {
			throw InvalidParameter("Dates must be strictly increasing.");
		}
	}
}

TimeSeries::TimeSeries(std::vector<Value> values, std::string entity)
    : values_(std::move(values)), entity_(std::move(entity)), has_calendar_(false) {
}

Date TimeSeries::dateAt(std::size_t index) const {
	if (!has_calendar_) {
		throw std::logic_error("Positional series carry no calendar dates.");
	}
	return dates_.at(index);
}

std::optional<Date> TimeSeries::maybeDateAt(std::size_t index) const {
	if (!has_calendar_ || index >= dates_.size()) {
		return std::nullopt;
	}
	return dates_[index];
}

std::optional<std::size_t> TimeSeries::indexOf(const Date &date) const {
	if (!has_calendar_) {
		return std::nullopt;
	}
	const auto it = std::lower_bound(dates_.begin(), dates_.end(), date);
	if (it == dates_.end() || *it != date) {
		return std::nullopt;
	}
	return static_cast<std::size_t>(it - dates_.begin());
}

int TimeSeries::weekdayAt(std::size_t index) const {
	if (has_calendar_) {
		return dates_.at(index).dayOfWeek();
	}
	return static_cast<int>(index % 7);
}

std::int64_t TimeSeries::distance(std::size_t from, std::size_t to) const {
	if (has_calendar_) {
		return dates_.at(to) - dates_.at(from);
	}
	return static_cast<std::int64_t>(to) - static_cast<std::int64_t>(from);
}

TimeSeries TimeSeries::slice(std::size_t start, std::size_t end) const {
	if (start > end || end > values_.size()) {
		throw std::out_of_range("Invalid slice bounds for TimeSeries.");
	}
	std::vector<Value> values(values_.begin() + static_cast<std::ptrdiff_t>(start),
	                          values_.begin() + static_cast<std::ptrdiff_t>(end));
	if (!has_calendar_) {
		return TimeSeries(std::move(values), entity_);
	}
	std::vector<Date> dates(dates_.begin() + static_cast<std::ptrdiff_t>(start),
	                        dates_.begin() + static_cast<std::ptrdiff_t>(end));
	return TimeSeries(std::move(dates), std::move(values), entity_);
}

bool TimeSeries::isContiguous() const {
	if (!has_calendar_) {
		return true;
	}
	for (std::size_t i = 1; i < dates_.size(); ++i) {
		if (dates_[i] - dates_[i - 1] != 1) {
			return false;
		}
	}
	return true;
}

TimeSeries::Value TimeSeries::total() const {
	return std::accumulate(values_.begin(), values_.end(), 0.0);
}

TimeSeries::Value TimeSeries::mean() const {
	return values_.empty() ? 0.0 : total() / static_cast<double>(values_.size());
}

TimeSeries::Value TimeSeries::maxValue() const {
	return values_.empty() ? 0.0 : *std::max_element(values_.begin(), values_.end());
}

bool TimeSeries::operator==(const TimeSeries &other) const {
	return has_calendar_ == other.has_calendar_ && entity_ == other.entity_ && dates_ == other.dates_ &&
	       values_ == other.values_;
}

} // namespace entitypulse::core
