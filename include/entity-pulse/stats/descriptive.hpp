#pragma once

#include <cstddef>
#include <vector>

namespace entitypulse::stats {

double mean(const std::vector<double> &values);

/// Standard deviation with @p ddof delta degrees of freedom; 0 when fewer than ddof + 1 values.
double stddev(const std::vector<double> &values, int ddof = 1);

/// Quantile with linear interpolation between order statistics, q in [0, 1].
double quantile(std::vector<double> values, double q);

/// 1-based ranks with ties sharing their average rank.
std::vector<double> averageRanks(const std::vector<double> &values);

/// Population variance of all entries of a row-major matrix given as rows.
double matrixVariance(const std::vector<std::vector<double>> &rows);

} // namespace entitypulse::stats
