#include "entity-pulse/stats/correlation.hpp"
#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/stats/descriptive.hpp"

#include <boost/math/distributions/students_t.hpp>

#include <algorithm>
#include <cmath>

namespace entitypulse::stats {

std::string toString(CorrelationMethod method) {
	switch (method) {
	case CorrelationMethod::Pearson:
		return "pearson";
	case CorrelationMethod::Spearman:
		return "spearman";
	}
	return "unknown";
}

CorrelationMethod parseCorrelationMethod(const std::string &name) {
	if (name == "pearson") {
		return CorrelationMethod::Pearson;
	}
	if (name == "spearman") {
		return CorrelationMethod::Spearman;
	}
	throw core::InvalidParameter("Unknown correlation method: " + name);
}

double correlationPValue(double r, std::size_t n) {
	if (n < 3) {
		return 1.0;
	}
	const double abs_r = std::abs(r);
	if (abs_r >= 1.0 - 1e-12) {
		return 0.0;
	}
	const double df = static_cast<double>(n - 2);
	const double t = abs_r * std::sqrt(df / (1.0 - abs_r * abs_r));
	const boost::math::students_t dist(df);
	return std::clamp(2.0 * boost::math::cdf(boost::math::complement(dist, t)), 0.0, 1.0);
}

CorrelationStats pearson(const std::vector<double> &x, const std::vector<double> &y) {
	if (x.size() != y.size()) {
		throw core::InvalidParameter("Correlation inputs must have the same length.");
	}
	CorrelationStats result;
	result.n = x.size();
	if (x.size() < 3) {
		return result;
	}

	const double mx = mean(x);
	const double my = mean(y);
	double sxy = 0.0;
	double sxx = 0.0;
	double syy = 0.0;
	for (std::size_t i = 0; i < x.size(); ++i) {
		const double dx = x[i] - mx;
		const double dy = y[i] - my;
		sxy += dx * dy;
		sxx += dx * dx;
		syy += dy * dy;
	}
	if (sxx <= 0.0 || syy <= 0.0) {
		return result;
	}

	result.coefficient = std::clamp(sxy / std::sqrt(sxx * syy), -1.0, 1.0);
	result.p_value = correlationPValue(result.coefficient, result.n);
	return result;
}

CorrelationStats spearman(const std::vector<double> &x, const std::vector<double> &y) {
	if (x.size() != y.size()) {
		throw core::InvalidParameter("Correlation inputs must have the same length.");
	}
	return pearson(averageRanks(x), averageRanks(y));
}

CorrelationStats correlate(const std::vector<double> &x, const std::vector<double> &y, CorrelationMethod method) {
	return method == CorrelationMethod::Spearman ? spearman(x, y) : pearson(x, y);
}

} // namespace entitypulse::stats
