#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace entitypulse::stats {

enum class CorrelationMethod { Pearson, Spearman };

std::string toString(CorrelationMethod method);
CorrelationMethod parseCorrelationMethod(const std::string &name);

/**
 * @struct CorrelationStats
 * @brief A correlation coefficient with its two-sided significance.
 */
struct CorrelationStats {
	double coefficient = 0.0;
	double p_value = 1.0;
	std::size_t n = 0;
};

/**
 * @brief Pearson product-moment correlation of two equally long samples.
 *
 * Constant inputs carry no evidence and give (0, 1). Fewer than three points give (0, 1).
 */
CorrelationStats pearson(const std::vector<double> &x, const std::vector<double> &y);

/// Spearman rank correlation: Pearson on average ranks.
CorrelationStats spearman(const std::vector<double> &x, const std::vector<double> &y);

CorrelationStats correlate(const std::vector<double> &x, const std::vector<double> &y, CorrelationMethod method);

/**
 * @brief Two-sided p-value of a correlation coefficient under Student's t with n - 2 dof.
 */
double correlationPValue(double r, std::size_t n);

} // namespace entitypulse::stats
