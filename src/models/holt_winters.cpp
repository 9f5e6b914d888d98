#include "entity-pulse/models/holt_winters.hpp"
#include "entity-pulse/utils/logging.hpp"
#include "entity-pulse/utils/nelder_mead.hpp"

#include <numeric>
#include <stdexcept>

namespace entitypulse::models {

namespace {

constexpr double kMinParam = 1e-4;
constexpr double kMaxParam = 0.9999;

bool in_unit_interval(double value) {
	return value >= 0.0 && value <= 1.0;
}

} // namespace

HoltWinters::HoltWinters(int seasonal_period, std::optional<Parameters> fixed, int max_iterations)
    : seasonal_period_(seasonal_period), fixed_(fixed), max_iterations_(max_iterations) {
	if (seasonal_period_ < 2) {
		throw std::invalid_argument("Seasonal period must be >= 2.");
	}
	if (max_iterations_ < 1) {
		throw std::invalid_argument("Holt-Winters needs at least one optimizer iteration.");
	}
	if (fixed_ && !(in_unit_interval(fixed_->alpha) && in_unit_interval(fixed_->beta) &&
	                in_unit_interval(fixed_->gamma))) {
		throw std::invalid_argument("Holt-Winters smoothing parameters must lie in [0, 1].");
	}
}

HoltWinters::State HoltWinters::initialState(const std::vector<double> &y) const {
	const auto m = static_cast<std::size_t>(seasonal_period_);
	const double first = std::accumulate(y.begin(), y.begin() + static_cast<std::ptrdiff_t>(m), 0.0) /
	                     static_cast<double>(m);
	const double second = std::accumulate(y.begin() + static_cast<std::ptrdiff_t>(m),
	                                      y.begin() + static_cast<std::ptrdiff_t>(2 * m), 0.0) /
	                      static_cast<double>(m);
	State state;
	state.level = first;
	state.trend = (second - first) / static_cast<double>(m);
	state.season.resize(m);
	for (std::size_t i = 0; i < m; ++i) {
		state.season[i] = y[i] - first;
	}
	return state;
}

double HoltWinters::smooth(const std::vector<double> &y, const Parameters &params, State &state,
                           std::vector<double> *fitted) const {
	const auto m = static_cast<std::size_t>(seasonal_period_);
	double sse = 0.0;
	for (std::size_t t = 0; t < y.size(); ++t) {
		double &season = state.season[t % m];
		const double forecast = state.level + state.trend + season;
		if (fitted) {
			fitted->push_back(forecast);
		}
		sse += (y[t] - forecast) * (y[t] - forecast);

		const double previous_level = state.level;
		state.level = params.alpha * (y[t] - season) + (1.0 - params.alpha) * (state.level + state.trend);
		state.trend = params.beta * (state.level - previous_level) + (1.0 - params.beta) * state.trend;
		season = params.gamma * (y[t] - state.level) + (1.0 - params.gamma) * season;
	}
	return sse;
}

void HoltWinters::fit(const core::TimeSeries &ts) {
	const auto &y = ts.getValues();
	if (y.size() < static_cast<std::size_t>(2 * seasonal_period_)) {
		throw std::invalid_argument("Holt-Winters needs at least two full seasons of data.");
	}
	const State initial = initialState(y);

	if (fixed_) {
		params_ = *fixed_;
	} else {
		const auto objective = [&](const std::vector<double> &x) {
			State state = initial;
			return smooth(y, Parameters{x[0], x[1], x[2]}, state, nullptr);
		};
		utils::NelderMeadOptimizer::Options options;
		options.max_iterations = max_iterations_;
		const Parameters start;
		const auto result = utils::NelderMeadOptimizer().minimize(
		    objective, {start.alpha, start.beta, start.gamma}, options, {kMinParam, kMinParam, kMinParam},
		    {kMaxParam, kMaxParam, kMaxParam}, cancellationToken());
		params_ = Parameters{result.best[0], result.best[1], result.best[2]};
		ENTITYPULSE_DEBUG("Holt-Winters optimizer: {} iterations, converged = {}.", result.iterations,
		                  result.converged);
	}

	state_ = initial;
	fitted_.clear();
	fitted_.reserve(y.size());
	sse_ = smooth(y, params_, state_, &fitted_);
	n_ = y.size();
	is_fitted_ = true;
	ENTITYPULSE_DEBUG("Holt-Winters fitted: alpha={:.4f}, beta={:.4f}, gamma={:.4f}, SSE={:.4f}", params_.alpha,
	                  params_.beta, params_.gamma, sse_);
}

std::vector<double> HoltWinters::predict(int horizon) {
	if (!is_fitted_) {
		throw std::runtime_error("HoltWinters::predict called before fit.");
	}
	std::vector<double> forecast;
	if (horizon <= 0) {
		return forecast;
	}
	const auto m = static_cast<std::size_t>(seasonal_period_);
	forecast.reserve(static_cast<std::size_t>(horizon));
	for (int h = 1; h <= horizon; ++h) {
		const double season = state_.season[(n_ + static_cast<std::size_t>(h) - 1) % m];
		forecast.push_back(state_.level + static_cast<double>(h) * state_.trend + season);
	}
	return forecast;
}

HoltWintersBuilder &HoltWintersBuilder::withSeasonalPeriod(int period) {
	period_ = period;
	return *this;
}

HoltWintersBuilder &HoltWintersBuilder::withParameters(double alpha, double beta, double gamma) {
	fixed_ = HoltWinters::Parameters{alpha, beta, gamma};
	return *this;
}

HoltWintersBuilder &HoltWintersBuilder::withMaxIterations(int iterations) {
	max_iterations_ = iterations;
	return *this;
}

std::unique_ptr<HoltWinters> HoltWintersBuilder::build() {
	return std::unique_ptr<HoltWinters>(new HoltWinters(period_, fixed_, max_iterations_));
}

} // namespace entitypulse::models
