#pragma once

#include "entity-pulse/models/iforecaster.hpp"
#include "entity-pulse/models/regressor.hpp"

namespace entitypulse::models {

/// Ordinary least squares with an intercept.
class LinearRegression final : public IRegressor {
public:
	void fit(const Eigen::MatrixXd &x, const Eigen::VectorXd &y,
	         const utils::CancellationToken &token = utils::CancellationToken()) override;
	Eigen::VectorXd predict(const Eigen::MatrixXd &x) const override;

	std::string getName() const override {
		return "LinearRegression";
	}

	double intercept() const {
		return intercept_;
	}
	const Eigen::VectorXd &coefficients() const {
		return coefficients_;
	}

private:
	double intercept_ = 0.0;
	Eigen::VectorXd coefficients_;
	bool is_fitted_ = false;
};

/**
 * @class LinearTrend
 * @brief Straight-line fit of the values against their day index, extrapolated forward.
 */
class LinearTrend final : public IForecaster {
public:
	void fit(const core::TimeSeries &ts) override;
	std::vector<double> predict(int horizon) override;

	std::string getName() const override {
		return "LinearTrend";
	}

	double slope() const;
	double intercept() const {
		return regression_.intercept();
	}

private:
	LinearRegression regression_;
	std::size_t n_ = 0;
	bool is_fitted_ = false;
};

} // namespace entitypulse::models
