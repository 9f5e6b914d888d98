#include "entity-pulse/models/linear_trend.hpp"
#include "entity-pulse/utils/logging.hpp"

#include <stdexcept>

namespace entitypulse::models {

void LinearRegression::fit(const Eigen::MatrixXd &x, const Eigen::VectorXd &y, const utils::CancellationToken &) {
	if (x.rows() == 0 || x.rows() != y.size()) {
		throw std::invalid_argument("LinearRegression needs a non-empty design matrix matching the target.");
	}
	Eigen::MatrixXd design(x.rows(), x.cols() + 1);
	design.col(0).setOnes();
	design.rightCols(x.cols()) = x;
	const Eigen::VectorXd beta = design.colPivHouseholderQr().solve(y);
	intercept_ = beta[0];
	coefficients_ = beta.tail(x.cols());
	is_fitted_ = true;
}

Eigen::VectorXd LinearRegression::predict(const Eigen::MatrixXd &x) const {
	if (!is_fitted_) {
		throw std::runtime_error("LinearRegression::predict called before fit.");
	}
	if (x.cols() != coefficients_.size()) {
		throw std::invalid_argument("Feature count differs from the fitted model.");
	}
	return ((x * coefficients_).array() + intercept_).matrix();
}

void LinearTrend::fit(const core::TimeSeries &ts) {
	if (ts.size() < 2) {
		throw std::invalid_argument("LinearTrend needs at least two observations.");
	}
	n_ = ts.size();
	const Eigen::MatrixXd index = Eigen::VectorXd::LinSpaced(static_cast<Eigen::Index>(n_), 0.0,
	                                                         static_cast<double>(n_ - 1));
	const Eigen::Map<const Eigen::VectorXd> y(ts.getValues().data(), static_cast<Eigen::Index>(n_));
	regression_.fit(index, y, cancellationToken());
	is_fitted_ = true;
	ENTITYPULSE_DEBUG("LinearTrend fitted: intercept={:.4f}, slope={:.4f}", intercept(), slope());
}

double LinearTrend::slope() const {
	return is_fitted_ ? regression_.coefficients()[0] : 0.0;
}

std::vector<double> LinearTrend::predict(int horizon) {
	if (!is_fitted_) {
		throw std::runtime_error("LinearTrend::predict called before fit.");
	}
	if (horizon <= 0) {
		return {};
	}
	const Eigen::MatrixXd future = Eigen::VectorXd::LinSpaced(horizon, static_cast<double>(n_),
	                                                          static_cast<double>(n_ + horizon - 1));
	const Eigen::VectorXd values = regression_.predict(future);
	return std::vector<double>(values.data(), values.data() + values.size());
}

} // namespace entitypulse::models
