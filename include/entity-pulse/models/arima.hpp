#pragma once

#include "entity-pulse/models/iforecaster.hpp"

#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <vector>

namespace entitypulse::models {

class ARIMABuilder; // Forward declaration

/**
 * @class ARIMA
 * @brief Non-seasonal ARIMA(p, d, q) with Yule-Walker AR estimation.
 *
 * The series is differenced d times, AR coefficients are solved from the sample
 * autocorrelations and MA coefficients from lagged residual correlations, refined over a
 * few alternating passes.
 */
class ARIMA final : public IForecaster {
public:
	friend class ARIMABuilder;

	void fit(const core::TimeSeries &ts) override;
	std::vector<double> predict(int horizon) override;

	std::string getName() const override {
		return "ARIMA";
	}

	const Eigen::VectorXd &arCoefficients() const {
		return ar_coeffs_;
	}
	const Eigen::VectorXd &maCoefficients() const {
		return ma_coeffs_;
	}
	double intercept() const {
		return intercept_;
	}
	const std::vector<double> &residuals() const {
		return residuals_;
	}
	double sigma2() const {
		return sigma2_;
	}
	std::optional<double> aic() const {
		return aic_;
	}

	int p() const {
		return p_;
	}
	int d() const {
		return d_;
	}
	int q() const {
		return q_;
	}

	static std::vector<double> difference(const std::vector<double> &data, int d);
	static std::vector<double> integrate(const std::vector<double> &forecast_diff,
	                                     const std::vector<double> &last_values, int d);

private:
	ARIMA(int p, int d, int q, bool include_intercept);

	double predictDifferenced(std::size_t t) const;

	int p_, d_, q_;
	bool include_intercept_;
	Eigen::VectorXd ar_coeffs_;
	Eigen::VectorXd ma_coeffs_;
	double intercept_ = 0.0;
	double mean_ = 0.0;
	std::vector<double> differenced_history_;
	std::vector<double> last_values_;
	std::vector<double> residuals_;
	double sigma2_ = 0.0;
	std::optional<double> aic_;
	bool is_fitted_ = false;
};

/// Builds ARIMA models; the default order is (5, 1, 0).
class ARIMABuilder {
public:
	ARIMABuilder &withAR(int p);
	ARIMABuilder &withDifferencing(int d);
	ARIMABuilder &withMA(int q);
	ARIMABuilder &withIntercept(bool include_intercept);
	std::unique_ptr<ARIMA> build();

private:
	int p_ = 5;
	int d_ = 1;
	int q_ = 0;
	bool include_intercept_ = true;
};

} // namespace entitypulse::models
