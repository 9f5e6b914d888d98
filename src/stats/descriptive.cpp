#include "entity-pulse/stats/descriptive.hpp"
#include "entity-pulse/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace entitypulse::stats {

double mean(const std::vector<double> &values) {
	if (values.empty()) {
		return 0.0;
	}
	return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double stddev(const std::vector<double> &values, int ddof) {
	if (values.size() <= static_cast<std::size_t>(ddof)) {
		return 0.0;
	}
	const double m = mean(values);
	double accum = 0.0;
	for (double v : values) {
		const double diff = v - m;
		accum += diff * diff;
	}
	return std::sqrt(accum / static_cast<double>(values.size() - static_cast<std::size_t>(ddof)));
}

double quantile(std::vector<double> values, double q) {
	if (values.empty()) {
		throw core::InvalidParameter("Quantile of an empty sample is undefined.");
	}
	if (q < 0.0 || q > 1.0) {
		throw core::InvalidParameter("Quantile level must lie in [0, 1].");
	}
	std::sort(values.begin(), values.end());
	const double position = q * static_cast<double>(values.size() - 1);
	const auto lower = static_cast<std::size_t>(std::floor(position));
	const auto upper = static_cast<std::size_t>(std::ceil(position));
	const double weight = position - static_cast<double>(lower);
	return values[lower] + (values[upper] - values[lower]) * weight;
}

std::vector<double> averageRanks(const std::vector<double> &values) {
	const std::size_t n = values.size();
	std::vector<std::size_t> order(n);
	std::iota(order.begin(), order.end(), 0);
	std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) { return values[a] < values[b]; });

	std::vector<double> ranks(n, 0.0);
	std::size_t i = 0;
	while (i < n) {
		std::size_t j = i;
		while (j + 1 < n && values[order[j + 1]] == values[order[i]]) {
			++j;
		}
		const double rank = (static_cast<double>(i) + static_cast<double>(j)) / 2.0 + 1.0;
		for (std::size_t k = i; k <= j; ++k) {
			ranks[order[k]] = rank;
		}
		i = j + 1;
	}
	return ranks;
}

double matrixVariance(const std::vector<std::vector<double>> &rows) {
	std::vector<double> flat;
	for (const auto &row : rows) {
		flat.insert(flat.end(), row.begin(), row.end());
	}
	const double sd = stddev(flat, 0);
	return sd * sd;
}

} // namespace entitypulse::stats
