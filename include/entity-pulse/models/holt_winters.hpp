#pragma once

#include "entity-pulse/models/iforecaster.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace entitypulse::models {

class HoltWintersBuilder;

/**
 * @brief Holt-Winters with additive trend and additive seasonality.
 *
 * Smoothing parameters are fitted by Nelder-Mead on the in-sample one-step squared error
 * unless they were fixed through the builder. Fitting needs two full seasons.
 */
class HoltWinters final : public IForecaster {
public:
	friend class HoltWintersBuilder;

	struct Parameters {
		double alpha = 0.3;
		double beta = 0.1;
		double gamma = 0.1;
	};

	void fit(const core::TimeSeries &ts) override;
	std::vector<double> predict(int horizon) override;

	std::string getName() const override {
		return "HoltWinters";
	}

	int seasonalPeriod() const {
		return seasonal_period_;
	}
	const Parameters &parameters() const {
		return params_;
	}
	double sse() const {
		return sse_;
	}
	const std::vector<double> &fittedValues() const {
		return fitted_;
	}

private:
	struct State {
		double level = 0.0;
		double trend = 0.0;
		std::vector<double> season;
	};

	HoltWinters(int seasonal_period, std::optional<Parameters> fixed, int max_iterations);

	State initialState(const std::vector<double> &y) const;
	/// Runs the recursions over @p y; returns the one-step squared error and fills @p fitted when given.
	double smooth(const std::vector<double> &y, const Parameters &params, State &state,
	              std::vector<double> *fitted) const;

	int seasonal_period_;
	std::optional<Parameters> fixed_;
	int max_iterations_;
	Parameters params_;
	State state_;
	std::vector<double> fitted_;
	std::size_t n_ = 0;
	double sse_ = 0.0;
	bool is_fitted_ = false;
};

class HoltWintersBuilder {
public:
	HoltWintersBuilder &withSeasonalPeriod(int period);
	/// Uses the given smoothing parameters instead of fitting them.
	HoltWintersBuilder &withParameters(double alpha, double beta, double gamma);
	HoltWintersBuilder &withMaxIterations(int iterations);
	std::unique_ptr<HoltWinters> build();

private:
	int period_ = 7;
	std::optional<HoltWinters::Parameters> fixed_;
	int max_iterations_ = 500;
};

} // namespace entitypulse::models
